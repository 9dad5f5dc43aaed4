/**
 * @file
 * @brief AstGraph: nodes/edges export with short per-kind labels.
 */
#include "report/AstGraph.h"
#include "ast/Children.h"
#include "ast/Nodes.h"
#include "ast/Unparse.h"
#include "ast/Visitor.h"

#include <string>

namespace pyinfer::report {

using json = nlohmann::json;

namespace {

class Labeler {
 public:
  std::string label;

  void visit(const ast::Module&) { label = "Module"; }
  void visit(const ast::FunctionDef& f) { label = "Func: " + f.name; }
  void visit(const ast::ClassDef& c) { label = "Class: " + c.name; }
  void visit(const ast::AssignStmt&) { label = "Assign"; }
  void visit(const ast::Name& n) { label = "Name: " + n.id; }
  void visit(const ast::Call& c) { label = "Call: " + (c.callee ? ast::DottedName(*c.callee) : std::string("?")); }
  void visit(const ast::IntLiteral& lit) { label = "Const: " + lit.value; }
  void visit(const ast::FloatLiteral& lit) { label = "Const: " + lit.value; }
  void visit(const ast::ImagLiteral& lit) { label = "Const: " + lit.value; }
  void visit(const ast::StringLiteral& lit) { label = "Const: " + lit.value; }
  void visit(const ast::BytesLiteral& lit) { label = "Const: " + lit.value; }
  void visit(const ast::BoolLiteral& lit) { label = lit.value ? "Const: True" : "Const: False"; }
  void visit(const ast::NoneLiteral&) { label = "Const: None"; }
  void visit(const ast::Attribute& a) { label = "Attr: " + a.attr; }
  void visit(const ast::Import&) { label = "Import"; }
  void visit(const ast::ImportFrom&) { label = "Import"; }
  void visit(const ast::Binary&) { label = "BinOp"; }
  void visit(const ast::Compare&) { label = "Compare"; }
  void visit(const ast::IfStmt&) { label = "If"; }
  void visit(const ast::ForStmt&) { label = "For"; }
  void visit(const ast::WhileStmt&) { label = "While"; }
  void visit(const ast::ReturnStmt&) { label = "Return"; }
  template <typename T>
  void visit(const T& node) { label = ast::to_string(node.kind); }
};

void addNode(const ast::Node& node, json& nodes, json& edges) {
  const std::string id = "node_" + std::to_string(node.id);
  nodes.push_back({{"id", id},
                   {"label", GraphLabel(node)},
                   {"type", ast::to_string(node.kind)},
                   {"line", node.line},
                   {"col", node.col}});
  ast::ForEachChild(node, [&](const ast::Node& child) {
    edges.push_back({{"from", id}, {"to", "node_" + std::to_string(child.id)}});
    addNode(child, nodes, edges);
  });
}

} // namespace

std::string GraphLabel(const ast::Node& node) {
  Labeler labeler;
  ast::dispatch(node, labeler);
  return labeler.label;
}

json AstGraph(const ast::Module& mod) {
  json nodes = json::array();
  json edges = json::array();
  addNode(mod, nodes, edges);
  return {{"nodes", nodes}, {"edges", edges}};
}

} // namespace pyinfer::report
