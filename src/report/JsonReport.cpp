/***
 * Name: pyinfer::report (JSON impl)
 */
#include "report/JsonReport.h"
#include "ast/Children.h"
#include "ast/Nodes.h"
#include "ast/Unparse.h"
#include "ast/Visitor.h"

#include <optional>
#include <string>
#include <vector>

namespace pyinfer::report {

using json = nlohmann::json;

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& value) {
  return value ? json(*value) : json(nullptr);
}

// Scalar attributes per node kind.
class FieldCollector {
 public:
  json fields = json::object();

  void visit(const ast::FunctionDef& f) {
    fields["name"] = f.name;
    fields["is_async"] = f.isAsync;
    json params = json::array();
    for (const auto& p : f.params) {
      json param;
      param["arg"] = p.name;
      param["kind"] = ast::to_string(p.kind);
      param["annotation"] = p.annotation ? json(ast::RenderExpr(*p.annotation)) : json(nullptr);
      params.push_back(param);
    }
    fields["args"] = params;
  }
  void visit(const ast::ClassDef& c) { fields["name"] = c.name; }
  void visit(const ast::AnnAssignStmt& a) { fields["simple"] = a.simple; }
  void visit(const ast::AugAssignStmt& a) { fields["op"] = ast::to_string(a.op); }
  void visit(const ast::ForStmt& f) { fields["is_async"] = f.isAsync; }
  void visit(const ast::WithStmt& w) { fields["is_async"] = w.isAsync; }
  void visit(const ast::ExceptHandler& h) { fields["name"] = h.name.empty() ? json(nullptr) : json(h.name); }
  void visit(const ast::GlobalStmt& g) { fields["names"] = g.names; }
  void visit(const ast::NonlocalStmt& n) { fields["names"] = n.names; }
  void visit(const ast::Import& i) { fields["names"] = aliases(i.names); }
  void visit(const ast::ImportFrom& i) {
    fields["module"] = i.module;
    fields["level"] = i.level;
    fields["names"] = aliases(i.names);
  }
  void visit(const ast::IntLiteral& lit) { fields["value"] = lit.value; }
  void visit(const ast::FloatLiteral& lit) { fields["value"] = lit.value; }
  void visit(const ast::ImagLiteral& lit) { fields["value"] = lit.value; }
  void visit(const ast::StringLiteral& lit) { fields["value"] = lit.value; }
  void visit(const ast::BytesLiteral& lit) { fields["value"] = lit.value; }
  void visit(const ast::BoolLiteral& lit) { fields["value"] = lit.value; }
  void visit(const ast::NoneLiteral&) { fields["value"] = nullptr; }
  void visit(const ast::Name& n) {
    fields["id"] = n.id;
    fields["ctx"] = ast::to_string(n.ctx);
  }
  void visit(const ast::Attribute& a) {
    fields["attr"] = a.attr;
    fields["ctx"] = ast::to_string(a.ctx);
  }
  void visit(const ast::Binary& b) { fields["op"] = ast::to_string(b.op); }
  void visit(const ast::BoolOp& b) { fields["op"] = ast::to_string(b.op); }
  void visit(const ast::Unary& u) { fields["op"] = ast::to_string(u.op); }
  void visit(const ast::Compare& c) {
    json ops = json::array();
    for (const auto op : c.ops) { ops.push_back(ast::to_string(op)); }
    fields["ops"] = ops;
  }
  void visit(const ast::YieldExpr& y) { fields["is_from"] = y.isFrom; }
  template <typename T>
  void visit(const T&) {}

 private:
  static json aliases(const std::vector<ast::Alias>& names) {
    json out = json::array();
    for (const auto& a : names) {
      out.push_back({{"name", a.name}, {"asname", a.asname.empty() ? json(nullptr) : json(a.asname)}});
    }
    return out;
  }
};

json functionToJson(const sema::FunctionSymbol& fn) {
  json params = json::array();
  for (const auto& p : fn.params) {
    params.push_back({{"name", p.name},
                      {"kind", ast::to_string(p.kind)},
                      {"annotation", optionalToJson(p.annotation)},
                      {"default_type", optionalToJson(p.defaultType)},
                      {"has_default", p.hasDefault}});
  }
  return {{"name", fn.name},
          {"lineno", fn.line},
          {"args", fn.paramNames()},
          {"params", params},
          {"returns", optionalToJson(fn.returnAnnotation)},
          {"decorators", fn.decorators},
          {"scope", fn.scopeDepth},
          {"is_async", fn.isAsync},
          {"class", fn.enclosingClass.empty() ? json(nullptr) : json(fn.enclosingClass)},
          {"inferred_return_type", optionalToJson(fn.inferredReturn)}};
}

} // namespace

json TreeToJson(const ast::Node& node) {
  FieldCollector collector;
  ast::dispatch(node, collector);
  json children = json::array();
  ast::ForEachChild(node, [&children](const ast::Node& child) { children.push_back(TreeToJson(child)); });
  return {{"id", "node_" + std::to_string(node.id)},
          {"node_type", ast::to_string(node.kind)},
          {"lineno", node.line},
          {"col_offset", node.col},
          {"fields", collector.fields},
          {"children", children}};
}

json SymbolTableToJson(const sema::SymbolTable& table) {
  json out;
  out["functions"] = json::object();
  for (const auto& [name, fn] : table.functions) { out["functions"][name] = functionToJson(fn); }
  out["classes"] = json::object();
  for (const auto& [name, cls] : table.classes) {
    out["classes"][name] = {{"name", cls.name},
                            {"lineno", cls.line},
                            {"bases", cls.bases},
                            {"decorators", cls.decorators},
                            {"methods", cls.methods},
                            {"scope", cls.scopeDepth}};
  }
  out["variables"] = json::object();
  for (const auto& [name, var] : table.variables) {
    out["variables"][name] = {{"name", var.name},
                              {"lineno", var.line},
                              {"annotation", optionalToJson(var.annotation)},
                              {"inferred_type", optionalToJson(var.inferredType)},
                              {"scope", var.scopeDepth}};
  }
  out["imports"] = json::object();
  for (const auto& [name, imp] : table.imports) {
    out["imports"][name] = {{"name", imp.name},
                            {"module", imp.module},
                            {"original_name", optionalToJson(imp.originalName)},
                            {"alias", optionalToJson(imp.alias)},
                            {"lineno", imp.line},
                            {"type", sema::to_string(imp.kind)}};
  }
  out["global_scope"] = json::object();
  for (const auto& [name, entry] : table.globalScope) {
    out["global_scope"][name] = {{"type", sema::to_string(entry.kind)}, {"lineno", entry.line}};
  }
  out["implicit_bindings"] = table.implicitBindings;
  return out;
}

json UndeclaredToJson(const std::vector<sema::UndeclaredReference>& refs) {
  json out = json::array();
  for (const auto& ref : refs) {
    out.push_back({{"name", ref.name},
                   {"lineno", ref.line},
                   {"col_offset", ref.col},
                   {"context", ref.context},
                   {"function", optionalToJson(ref.function)}});
  }
  return out;
}

json TypeInfoToJson(const annotate::TypeInfo& info) {
  json out;
  out["variables"] = json::object();
  for (const auto& [name, var] : info.variables) {
    out["variables"][name] = {{"type", var.type}, {"line", var.line}, {"source", annotate::to_string(var.source)}};
  }
  out["functions"] = json::object();
  for (const auto& [name, fn] : info.functions) {
    json params = json::object();
    for (const auto& [param, type] : fn.params) { params[param] = type; }
    out["functions"][name] = {{"params", params}, {"return", fn.returnType}, {"line", fn.line}};
  }
  return out;
}

json AnalysisToJson(const AnalysisResult& result) {
  json out;
  out["success"] = result.success;
  out["ast"] = result.module ? TreeToJson(*result.module) : json(nullptr);
  out["symbol_table"] = result.symbols ? SymbolTableToJson(*result.symbols) : json(nullptr);
  out["undeclared_names"] = UndeclaredToJson(result.undeclared);
  out["error"] = result.success ? json(nullptr) : json(result.error);
  return out;
}

json AnnotationToJson(const AnnotationResult& result) {
  json out;
  out["success"] = result.success;
  out["original_code"] = result.originalText;
  out["annotated_code"] = result.success ? json(result.annotatedText) : json(nullptr);
  out["type_info"] = TypeInfoToJson(result.typeInfo);
  out["annotations_count"] = result.annotationCount;
  out["error"] = result.success ? json(nullptr) : json(result.error);
  return out;
}

} // namespace pyinfer::report
