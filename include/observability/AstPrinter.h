/***
 * Name: pyinfer::obs::AstPrinter
 * Purpose: Visitor-based tree pretty-printer for diagnostics/logging.
 * Inputs:
 *   - ast::Module (numbered)
 * Outputs:
 *   - One line per node: "<Kind> #<id> @<line>:<col>" plus salient fields,
 *     indented two spaces per level of depth.
 * Theory of Operation:
 *   Routes each node through ast::dispatch to pick the salient fields, then
 *   recurses over ForEachChild so every node kind is reached.
 */
#pragma once

#include <sstream>
#include <string>
#include <vector>
#include "ast/Children.h"
#include "ast/Nodes.h"
#include "ast/Unparse.h"
#include "ast/Visitor.h"

namespace pyinfer::obs {

class AstPrinter {
 public:
  std::string print(const ast::Module& m) {
    ss_.str(""); ss_.clear(); depth_ = 0;
    walk(m);
    return ss_.str();
  }

  void visit(const ast::FunctionDef& f) { extra_ = std::string(" name=") + f.name + (f.isAsync ? " async" : "") + " params=" + std::to_string(f.params.size()); }
  void visit(const ast::ClassDef& c) { extra_ = std::string(" name=") + c.name + " bases=" + std::to_string(c.bases.size()); }
  void visit(const ast::AugAssignStmt& a) { extra_ = std::string(" op=") + ast::to_string(a.op) + "="; }
  void visit(const ast::ExceptHandler& h) { if (!h.name.empty()) { extra_ = " as=" + h.name; } }
  void visit(const ast::GlobalStmt& g) { extra_ = " names=" + join(g.names); }
  void visit(const ast::NonlocalStmt& n) { extra_ = " names=" + join(n.names); }
  void visit(const ast::Import& i) { std::string s; for (const auto& a : i.names) { s += (s.empty() ? "" : ",") + a.name + (a.asname.empty() ? "" : " as " + a.asname); } extra_ = " names=" + s; }
  void visit(const ast::ImportFrom& i) { std::string s; for (const auto& a : i.names) { s += (s.empty() ? "" : ",") + a.name; } extra_ = " module=" + std::string(static_cast<size_t>(i.level), '.') + i.module + " names=" + s; }
  void visit(const ast::IntLiteral& lit) { extra_ = " " + lit.value; }
  void visit(const ast::FloatLiteral& lit) { extra_ = " " + lit.value; }
  void visit(const ast::ImagLiteral& lit) { extra_ = " " + lit.value; }
  void visit(const ast::StringLiteral& lit) { extra_ = " \"" + lit.value + "\""; }
  void visit(const ast::BytesLiteral& lit) { extra_ = " b\"" + lit.value + "\""; }
  void visit(const ast::BoolLiteral& lit) { extra_ = lit.value ? " True" : " False"; }
  void visit(const ast::Name& n) { extra_ = " " + n.id + " ctx=" + ast::to_string(n.ctx); }
  void visit(const ast::Attribute& a) { extra_ = " ." + a.attr + " ctx=" + ast::to_string(a.ctx); }
  void visit(const ast::Call& c) { if (c.callee) { extra_ = " callee=" + ast::DottedName(*c.callee); } }
  void visit(const ast::Binary& b) { extra_ = std::string(" op=") + ast::to_string(b.op); }
  void visit(const ast::BoolOp& b) { extra_ = std::string(" op=") + ast::to_string(b.op); }
  void visit(const ast::Unary& u) { extra_ = std::string(" op=") + ast::to_string(u.op); }
  void visit(const ast::Compare& c) { std::string s; for (auto op : c.ops) { s += (s.empty() ? "" : ",") + std::string(ast::to_string(op)); } extra_ = " ops=" + s; }
  void visit(const ast::NamedExpr& n) { if (n.target) { extra_ = " target=" + n.target->id; } }
  void visit(const ast::YieldExpr& y) { if (y.isFrom) { extra_ = " from"; } }
  template <typename T>
  void visit(const T&) {}

 private:
  void walk(const ast::Node& n) {
    extra_.clear();
    ast::dispatch(n, *this);
    for (int i = 0; i < depth_; ++i) ss_ << "  ";
    ss_ << ast::to_string(n.kind) << " #" << n.id << " @" << n.line << ":" << n.col << extra_ << "\n";
    depth_++;
    ast::ForEachChild(n, [this](const ast::Node& child) { walk(child); });
    depth_--;
  }
  static std::string join(const std::vector<std::string>& names) {
    std::string s;
    for (const auto& n : names) { s += (s.empty() ? "" : ",") + n; }
    return s;
  }
  std::ostringstream ss_{};
  std::string extra_{};
  int depth_{0};
};

} // namespace pyinfer::obs
