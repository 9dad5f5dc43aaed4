/***
 * Name: test_json_report
 * Purpose: JSON documents for trees, symbol tables and facade results.
 */
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "analyzer/Analyzer.h"
#include "report/JsonReport.h"

#include <string>

using namespace pyinfer;
using json = nlohmann::json;

TEST(JsonReport, TreeCarriesIdsPositionsAndFields) {
  const Analyzer analyzer;
  const auto result = analyzer.analyze("import os\ncount = 1\n", "t.py");
  ASSERT_TRUE(result.success);
  const json tree = report::TreeToJson(*result.module);
  EXPECT_EQ(tree["id"], "node_0");
  EXPECT_EQ(tree["node_type"], "Module");
  ASSERT_EQ(tree["children"].size(), 2u);
  const auto& imp = tree["children"][0];
  EXPECT_EQ(imp["node_type"], "Import");
  EXPECT_EQ(imp["fields"]["names"][0]["name"], "os");
  EXPECT_TRUE(imp["fields"]["names"][0]["asname"].is_null());
  const auto& assign = tree["children"][1];
  EXPECT_EQ(assign["lineno"], 2);
  EXPECT_EQ(assign["col_offset"], 0);
  EXPECT_EQ(assign["children"][0]["fields"]["id"], "count");
  EXPECT_EQ(assign["children"][0]["fields"]["ctx"], "store");
  EXPECT_EQ(assign["children"][1]["fields"]["value"], "1");
}

TEST(JsonReport, SymbolTableSections) {
  const Analyzer analyzer;
  const auto result = analyzer.analyze(R"PY(
from pathlib import Path as P
class Box:
    def size(self, n=1):
        return n
for k in range(2):
    pass
)PY");
  ASSERT_TRUE(result.success);
  const json doc = report::SymbolTableToJson(*result.symbols);
  for (const char* key : {"functions", "classes", "variables", "imports", "global_scope", "implicit_bindings"}) {
    EXPECT_TRUE(doc.contains(key)) << key;
  }
  const auto& size = doc["functions"]["size"];
  EXPECT_EQ(size["args"], json::array({"self", "n"}));
  EXPECT_EQ(size["class"], "Box");
  EXPECT_EQ(size["scope"], 1);
  EXPECT_EQ(size["inferred_return_type"], "int");
  EXPECT_EQ(size["params"][1]["default_type"], "int");
  EXPECT_TRUE(size["returns"].is_null());
  EXPECT_EQ(doc["classes"]["Box"]["methods"], json::array({"size"}));
  const auto& imp = doc["imports"]["P"];
  EXPECT_EQ(imp["type"], "from_import");
  EXPECT_EQ(imp["original_name"], "Path");
  EXPECT_EQ(imp["alias"], "P");
  EXPECT_EQ(doc["global_scope"]["Box"]["type"], "class");
  EXPECT_EQ(doc["implicit_bindings"], json::array({"k"}));
}

TEST(JsonReport, AnalysisSuccessDocument) {
  const Analyzer analyzer;
  const auto result = analyzer.analyze("def f(x): return x + y\n");
  const json doc = report::AnalysisToJson(result);
  EXPECT_TRUE(doc["success"].get<bool>());
  EXPECT_TRUE(doc["error"].is_null());
  ASSERT_EQ(doc["undeclared_names"].size(), 1u);
  const auto& ref = doc["undeclared_names"][0];
  EXPECT_EQ(ref["name"], "y");
  EXPECT_EQ(ref["lineno"], 1);
  EXPECT_EQ(ref["col_offset"], 21);
  EXPECT_EQ(ref["context"], "load");
  EXPECT_EQ(ref["function"], "f");
}

TEST(JsonReport, AnalysisFailureDocument) {
  const Analyzer analyzer;
  const auto result = analyzer.analyze("def (:\n");
  const json doc = report::AnalysisToJson(result);
  EXPECT_FALSE(doc["success"].get<bool>());
  EXPECT_TRUE(doc["ast"].is_null());
  EXPECT_TRUE(doc["symbol_table"].is_null());
  EXPECT_TRUE(doc["undeclared_names"].empty());
  EXPECT_EQ(doc["error"].get<std::string>().rfind("SyntaxError: ", 0), 0u);
}

TEST(JsonReport, AnnotationDocuments) {
  const Analyzer analyzer;
  const auto ok = analyzer.annotate("total = 1\n");
  const json good = report::AnnotationToJson(ok);
  EXPECT_TRUE(good["success"].get<bool>());
  EXPECT_EQ(good["original_code"], "total = 1\n");
  EXPECT_EQ(good["annotated_code"], "total: int = 1\n");
  EXPECT_EQ(good["annotations_count"], 1);
  EXPECT_EQ(good["type_info"]["variables"]["total"]["source"], "inferred");
  EXPECT_EQ(good["type_info"]["variables"]["total"]["line"], 1);

  const auto bad = analyzer.annotate("x = (\n");
  const json failed = report::AnnotationToJson(bad);
  EXPECT_FALSE(failed["success"].get<bool>());
  EXPECT_TRUE(failed["annotated_code"].is_null());
  EXPECT_EQ(failed["annotations_count"], 0);
  EXPECT_EQ(failed["original_code"], "x = (\n");
}

TEST(JsonReport, TypeInfoFunctionEntries) {
  annotate::TypeInfo info;
  annotate::FunctionTypeInfo fn;
  fn.params = {{"a", "int"}, {"b", "str"}};
  fn.returnType = "None";
  fn.line = 4;
  info.functions["g"] = fn;
  const json doc = report::TypeInfoToJson(info);
  EXPECT_EQ(doc["functions"]["g"]["params"]["b"], "str");
  EXPECT_EQ(doc["functions"]["g"]["return"], "None");
  EXPECT_EQ(doc["functions"]["g"]["line"], 4);
  EXPECT_TRUE(doc["variables"].empty());
}
