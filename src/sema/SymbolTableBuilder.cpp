/***
 * Name: pyinfer::sema::SymbolTableBuilder (impl)
 * Purpose: Declaration handling for functions, classes, assignments and imports.
 */
#include "sema/SymbolTableBuilder.h"
#include "ast/Children.h"
#include "ast/Unparse.h"
#include "ast/Visitor.h"
#include "sema/Unify.h"

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace pyinfer::sema {

SymbolTable SymbolTableBuilder::build(const ast::Module& mod) {
    table_ = SymbolTable{};
    depth_ = 0;
    directClass_.clear();
    params_.reset();
    visitChildren(mod);
    return std::move(table_);
}

void SymbolTableBuilder::visitChildren(const ast::Node& node) {
    ast::ForEachChild(node, [this](const ast::Node& child) { ast::dispatch(child, *this); });
}

void SymbolTableBuilder::declare(const std::string& name, const SymbolKind kind, const int line) {
    if (depth_ == 0) table_.globalScope[name] = ScopeEntry{kind, line};
}

ParamSymbol SymbolTableBuilder::recordParam(const ast::Param& param, LocalTypes& scope) const {
    ParamSymbol ps;
    ps.name = param.name;
    ps.kind = param.kind;
    ps.hasDefault = param.defaultValue != nullptr;
    if (param.annotation) ps.annotation = ast::RenderExpr(*param.annotation);
    if (param.defaultValue && param.defaultValue->kind != ast::NodeKind::NoneLiteral) {
        ps.defaultType = InferType(*param.defaultValue, table_, overlay());
    }
    TypeDescriptor local;
    if (param.kind == ast::ParamKind::VarArgs) {
        local = ps.annotation ? "tuple[" + *ps.annotation + ", ...]" : std::string(types::kTuple);
    } else if (param.kind == ast::ParamKind::VarKeywords) {
        local = ps.annotation ? "dict[str, " + *ps.annotation + "]" : std::string(types::kDict);
    } else if (ps.annotation) {
        local = *ps.annotation;
    } else if (ps.defaultType) {
        local = *ps.defaultType;
    } else {
        local = NameHeuristic(param.name);
    }
    scope[param.name] = std::move(local);
    return ps;
}

std::vector<TypeDescriptor> SymbolTableBuilder::collectReturns(const ast::FunctionDef& fn,
                                                               const LocalTypes& scope) const {
    std::vector<TypeDescriptor> out;
    std::function<void(const ast::Node&)> walk = [&](const ast::Node& node) {
        if (node.kind == ast::NodeKind::ReturnStmt) {
            const auto& ret = static_cast<const ast::ReturnStmt&>(node);
            if (ret.value) out.push_back(InferType(*ret.value, table_, &scope));
        }
        ast::ForEachChild(node, walk);
    };
    for (const auto& stmt : fn.body) { walk(*stmt); }
    return out;
}

void SymbolTableBuilder::visit(const ast::FunctionDef& fn) {
    FunctionSymbol sym;
    sym.name = fn.name;
    sym.line = fn.line;
    sym.col = fn.col;
    sym.isAsync = fn.isAsync;
    sym.scopeDepth = depth_;
    sym.enclosingClass = directClass_;
    for (const auto& dec : fn.decorators) { sym.decorators.push_back(ast::DottedName(*dec)); }
    if (fn.returns) sym.returnAnnotation = ast::RenderExpr(*fn.returns);

    // Enclosing parameters stay visible inside nested functions
    LocalTypes scope = params_ ? *params_ : LocalTypes{};
    for (const auto& p : fn.params) { sym.params.push_back(recordParam(p, scope)); }
    table_.functions[fn.name] = sym;
    declare(fn.name, SymbolKind::Function, fn.line);

    const std::string savedClass = std::exchange(directClass_, std::string{});
    auto savedParams = std::exchange(params_, scope);
    ++depth_;
    visitChildren(fn);
    --depth_;
    params_ = std::move(savedParams);
    directClass_ = savedClass;

    const auto returns = collectReturns(fn, scope);
    sym.hasValueReturn = !returns.empty();
    if (sym.hasValueReturn) sym.inferredReturn = UnionOf(returns);
    table_.functions[fn.name] = std::move(sym);
}

void SymbolTableBuilder::visit(const ast::ClassDef& cls) {
    ClassSymbol sym;
    sym.name = cls.name;
    sym.line = cls.line;
    sym.col = cls.col;
    sym.scopeDepth = depth_;
    for (const auto& base : cls.bases) { sym.bases.push_back(ast::DottedName(*base)); }
    for (const auto& dec : cls.decorators) { sym.decorators.push_back(ast::DottedName(*dec)); }
    for (const auto& stmt : cls.body) {
        if (stmt->kind == ast::NodeKind::FunctionDef) {
            sym.methods.push_back(static_cast<const ast::FunctionDef&>(*stmt).name);
        }
    }
    table_.classes[cls.name] = std::move(sym);
    declare(cls.name, SymbolKind::Class, cls.line);

    const std::string savedClass = std::exchange(directClass_, cls.name);
    ++depth_;
    visitChildren(cls);
    --depth_;
    directClass_ = savedClass;
}

void SymbolTableBuilder::visit(const ast::AssignStmt& assign) {
    const TypeDescriptor type = assign.value ? InferType(*assign.value, table_, overlay()) : std::string(types::kAny);
    for (const auto& target : assign.targets) {
        if (target->kind != ast::NodeKind::Name) {
            bindImplicit(*target);
            continue;
        }
        const auto& name = static_cast<const ast::Name&>(*target);
        VariableSymbol var;
        var.name = name.id;
        var.line = assign.line;
        var.col = name.col;
        var.inferredType = type;
        var.scopeDepth = depth_;
        table_.variables[name.id] = std::move(var);
        declare(name.id, SymbolKind::Variable, assign.line);
    }
    visitChildren(assign);
}

void SymbolTableBuilder::visit(const ast::AnnAssignStmt& assign) {
    if (assign.target && assign.target->kind == ast::NodeKind::Name) {
        const auto& name = static_cast<const ast::Name&>(*assign.target);
        VariableSymbol var;
        var.name = name.id;
        var.line = assign.line;
        var.col = name.col;
        if (assign.annotation) var.annotation = ast::RenderExpr(*assign.annotation);
        var.scopeDepth = depth_;
        table_.variables[name.id] = std::move(var);
        declare(name.id, SymbolKind::Variable, assign.line);
    }
    visitChildren(assign);
}

void SymbolTableBuilder::visit(const ast::Import& imp) {
    for (const auto& alias : imp.names) {
        ImportSymbol sym;
        // 'import a.b.c' binds 'a'
        sym.name = alias.asname.empty() ? alias.name.substr(0, alias.name.find('.')) : alias.asname;
        sym.module = alias.name;
        if (!alias.asname.empty()) sym.alias = alias.asname;
        sym.line = imp.line;
        sym.kind = ImportKind::Module;
        declare(sym.name, SymbolKind::Import, imp.line);
        table_.imports[sym.name] = std::move(sym);
    }
}

void SymbolTableBuilder::visit(const ast::ImportFrom& imp) {
    const std::string module = std::string(static_cast<std::size_t>(imp.level), '.') + imp.module;
    for (const auto& alias : imp.names) {
        ImportSymbol sym;
        sym.name = alias.asname.empty() ? alias.name : alias.asname;
        sym.module = module;
        sym.originalName = alias.name;
        if (!alias.asname.empty()) sym.alias = alias.asname;
        sym.line = imp.line;
        sym.kind = ImportKind::Selective;
        declare(sym.name, SymbolKind::Import, imp.line);
        table_.imports[sym.name] = std::move(sym);
    }
}

} // namespace pyinfer::sema
