/**
 * @file
 * @brief ReadSuggestions: tolerant loader for external type hints.
 */
#include "report/SuggestionsReader.h"
#include "pyinfer/exceptions/config_error.h"

#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace pyinfer::report {

using json = nlohmann::json;

annotate::Suggestions ReadSuggestions(const std::string& text) {
  const json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) throw exceptions::ConfigError("suggestions: not valid JSON");
  if (!doc.is_object()) throw exceptions::ConfigError("suggestions: top level must be an object");

  annotate::Suggestions out;
  const auto inferences = doc.find("inferences");
  if (inferences != doc.end() && inferences->is_object()) {
    for (const auto& [name, type] : inferences->items()) {
      if (type.is_string()) out.inferences[name] = type.get<std::string>();
    }
  }
  const auto functions = doc.find("function_suggestions");
  if (functions == doc.end() || !functions->is_object()) return out;
  for (const auto& [name, entry] : functions->items()) {
    if (!entry.is_object()) continue;
    annotate::FunctionSuggestion fs;
    const auto params = entry.find("params");
    if (params != entry.end() && params->is_object()) {
      for (const auto& [param, type] : params->items()) {
        if (type.is_string()) fs.params[param] = type.get<std::string>();
      }
    }
    const auto ret = entry.find("return");
    if (ret != entry.end() && ret->is_string()) fs.returnType = ret->get<std::string>();
    out.functionSuggestions[name] = std::move(fs);
  }
  return out;
}

} // namespace pyinfer::report
