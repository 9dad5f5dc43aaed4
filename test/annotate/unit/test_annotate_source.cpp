/***
 * Name: test_annotate_source
 * Purpose: Line rewriting of signatures and assignments.
 */
#include <gtest/gtest.h>
#include "annotate/Annotator.h"

#include <string>

using namespace pyinfer::annotate;

static FunctionTypeInfo fnInfo(int line, std::vector<std::pair<std::string, std::string>> params, std::string ret) {
  FunctionTypeInfo fn;
  fn.line = line;
  fn.params = std::move(params);
  fn.returnType = std::move(ret);
  return fn;
}

TEST(AnnotateSource, RewritesSignature) {
  TypeInfo info;
  info.functions["add"] = fnInfo(1, {{"a", "int"}, {"b", "int"}}, "int");
  EXPECT_EQ(AnnotateSource("def add(a, b):\n    return a + b\n", info),
            "def add(a: int, b: int) -> int:\n    return a + b\n");
}

TEST(AnnotateSource, DefaultsStarsAndMarkersArePreserved) {
  TypeInfo info;
  info.functions["run"] = fnInfo(1, {{"n", "int"}, {"args", "tuple"}, {"key", "str"}, {"kw", "dict"}}, "None");
  EXPECT_EQ(AnnotateSource("async def run(n=1, /, *args, key='k', **kw):  # go", info),
            "async def run(n: int = 1, /, *args: tuple, key: str = 'k', **kw: dict) -> None:  # go");
}

TEST(AnnotateSource, MethodReceiverStaysBare) {
  TypeInfo info;
  info.functions["area"] = fnInfo(2, {{"scale", "float"}}, "float");
  EXPECT_EQ(AnnotateSource("class S:\n    def area(self, scale=1.0):\n        pass", info),
            "class S:\n    def area(self, scale: float = 1.0) -> float:\n        pass");
}

TEST(AnnotateSource, EmptyParameterList) {
  TypeInfo info;
  info.functions["tick"] = fnInfo(1, {}, "None");
  EXPECT_EQ(AnnotateSource("def tick():\n    pass", info), "def tick() -> None:\n    pass");
}

TEST(AnnotateSource, SignaturesAlreadyTypedAreUntouched) {
  TypeInfo info;
  info.functions["f"] = fnInfo(1, {{"a", "int"}}, "int");
  info.functions["g"] = fnInfo(2, {{"a", "int"}}, "int");
  const std::string src = "def f(a) -> str:\n    pass\ndef g(a: int):\n    pass";
  EXPECT_EQ(AnnotateSource(src, info), "def f(a) -> str:\n    pass\ndef g(a: int):\n    pass");
}

TEST(AnnotateSource, MultiLineSignatureIsUntouched) {
  TypeInfo info;
  info.functions["f"] = fnInfo(1, {{"a", "int"}, {"b", "int"}}, "int");
  const std::string src = "def f(a,\n      b):\n    pass";
  EXPECT_EQ(AnnotateSource(src, info), src);
}

TEST(AnnotateSource, DefaultsContainingCommasAndParens) {
  TypeInfo info;
  info.functions["f"] = fnInfo(1, {{"pair", "tuple[int, int]"}, {"sep", "str"}}, "str");
  EXPECT_EQ(AnnotateSource("def f(pair=(1, 2), sep=', '):", info),
            "def f(pair: tuple[int, int] = (1, 2), sep: str = ', ') -> str:");
}

TEST(AnnotateSource, ColonInsideDefaultIsNotAnAnnotation) {
  TypeInfo info;
  info.functions["f"] = fnInfo(1, {{"d", "dict[str, int]"}, {"key", "Callable[..., Any]"}}, "None");
  EXPECT_EQ(AnnotateSource("def f(d={'a': 1}, key=lambda v: v):", info),
            "def f(d: dict[str, int] = {'a': 1}, key: Callable[..., Any] = lambda v: v) -> None:");
  EXPECT_EQ(AnnotateSource("def f(d: dict = {'a': 1}, key=None):", info), "def f(d: dict = {'a': 1}, key=None):");
}

TEST(AnnotateSource, RewritesSimpleAssignments) {
  TypeInfo info;
  info.variables["count"] = {"int", 1, TypeSource::Inferred};
  info.variables["name"] = {"str", 2, TypeSource::Inferred};
  info.variables["flag"] = {"bool", 3, TypeSource::Inferred};
  info.variables["typed"] = {"int", 4, TypeSource::Annotation};
  const std::string src = "count = 0\n    name='x'\nflag == True\ntyped: int = 1";
  EXPECT_EQ(AnnotateSource(src, info), "count: int = 0\n    name: str='x'\nflag == True\ntyped: int = 1");
}

TEST(AnnotateSource, WrongLineOrNameIsIgnored) {
  TypeInfo info;
  info.variables["x"] = {"int", 2, TypeSource::Inferred};
  info.variables["y"] = {"int", 99, TypeSource::Inferred};
  info.functions["h"] = fnInfo(1, {}, "int");
  const std::string src = "def other():\nxs = 1";
  EXPECT_EQ(AnnotateSource(src, info), src);
}

TEST(AnnotateSource, SecondPassIsIdempotent) {
  TypeInfo info;
  info.functions["add"] = fnInfo(1, {{"a", "int"}}, "int");
  info.variables["total"] = {"int", 3, TypeSource::Inferred};
  const std::string src = "def add(a):\n    return a\ntotal = add(1)\n";
  const auto once = AnnotateSource(src, info);
  EXPECT_EQ(AnnotateSource(once, info), once);
}

TEST(AnnotateSource, LineStructureIsPreserved) {
  TypeInfo info;
  info.variables["v"] = {"int", 2, TypeSource::Inferred};
  const std::string src = "\nv = 1\n\n# trailing\n";
  const auto out = AnnotateSource(src, info);
  EXPECT_EQ(out, "\nv: int = 1\n\n# trailing\n");
}
