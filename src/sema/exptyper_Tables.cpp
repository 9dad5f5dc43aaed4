/**
 * @file
 * @brief Builtin, method, naming and module-attribute tables.
 */
#include "sema/detail/exptyper/BuiltinTables.h"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pyinfer::sema::detail {

const std::unordered_map<std::string, TypeDescriptor>& builtinReturnTable() {
    static const std::unordered_map<std::string, TypeDescriptor> table = [] {
        std::unordered_map<std::string, TypeDescriptor> t{
            {"len", "int"}, {"ord", "int"}, {"hash", "int"}, {"id", "int"},
            {"str", "str"}, {"repr", "str"}, {"chr", "str"}, {"hex", "str"}, {"oct", "str"},
            {"bin", "str"}, {"format", "str"}, {"input", "str"},
            {"sorted", "list"}, {"reversed", "reversed"}, {"open", "TextIOWrapper"}, {"print", "None"},
            {"isinstance", "bool"}, {"issubclass", "bool"}, {"hasattr", "bool"}, {"callable", "bool"},
            {"any", "bool"}, {"all", "bool"},
            {"abs", "int | float"}, {"round", "int | float"}, {"pow", "int | float"}, {"sum", "int | float"},
            {"min", "int | float"}, {"max", "int | float"},
            {"divmod", "tuple[int, int]"}, {"iter", "iterator"},
        };
        // Constructors return their own type
        for (const char* self : {"int", "float", "bool", "list", "dict", "set", "frozenset", "tuple", "bytes",
                                 "bytearray", "complex", "type", "range", "enumerate", "zip", "map", "filter",
                                 "object"}) {
            t.emplace(self, self);
        }
        return t;
    }();
    return table;
}

const std::unordered_map<std::string, TypeDescriptor>& methodReturnTable() {
    static const std::unordered_map<std::string, TypeDescriptor> table = [] {
        std::unordered_map<std::string, TypeDescriptor> t{
            {"pop", "Any"}, {"get", "Any"}, {"setdefault", "Any"}, {"copy", "list"},
            {"split", "list[str]"}, {"rsplit", "list[str]"}, {"splitlines", "list[str]"}, {"readlines", "list[str]"},
            {"encode", "bytes"},
            {"keys", "dict_keys"}, {"values", "dict_values"}, {"items", "dict_items"},
        };
        for (const char* m : {"append", "extend", "insert", "remove", "clear", "reverse", "sort", "update", "add",
                              "discard"}) {
            t.emplace(m, "None");
        }
        for (const char* m : {"count", "index", "find", "rfind", "write"}) { t.emplace(m, "int"); }
        for (const char* m : {"join", "strip", "lstrip", "rstrip", "upper", "lower", "replace", "format",
                              "capitalize", "title", "casefold", "center", "ljust", "rjust", "zfill", "decode",
                              "read", "readline"}) {
            t.emplace(m, "str");
        }
        for (const char* m : {"startswith", "endswith", "isdigit", "isalpha", "isalnum", "isspace", "isupper",
                              "islower"}) {
            t.emplace(m, "bool");
        }
        for (const char* m : {"union", "intersection", "difference", "symmetric_difference"}) { t.emplace(m, "set"); }
        return t;
    }();
    return table;
}

const std::vector<std::pair<std::string, TypeDescriptor>>& namePatternTable() {
    static const std::vector<std::pair<std::string, TypeDescriptor>> table{
        {"numbers", "list[int | float]"},
        {"items", "list"},
        {"data", "list"},
        {"count", "int"},
        {"index", "int"},
        {"size", "int"},
        {"length", "int"},
        {"name", "str"},
        {"text", "str"},
        {"path", "str"},
        {"file", "str"},
        {"content", "str"},
        {"message", "str"},
        {"url", "str"},
        {"flag", "bool"},
        {"enabled", "bool"},
        {"config", "dict"},
        {"settings", "dict"},
        {"value", "int | float"},
    };
    return table;
}

const std::unordered_map<std::string, TypeDescriptor>& moduleAttributeTable() {
    static const std::unordered_map<std::string, TypeDescriptor> table{
        {"math.pi", "float"}, {"math.e", "float"}, {"math.tau", "float"}, {"math.inf", "float"},
        {"sys.argv", "list[str]"}, {"sys.platform", "str"},
        {"os.sep", "str"}, {"os.linesep", "str"},
    };
    return table;
}

} // namespace pyinfer::sema::detail
