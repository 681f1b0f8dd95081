/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gmock/gmock.h>

#include <trace-droid/LineScanning.h>
#include <trace-droid/tests/Test.h>

namespace tracedroid {

namespace {

SourceFile kotlin_file() {
  return test::make_source_file(
      "Foo.kt",
      "class Foo {\n"
      "  fun bar(x: Int): Int {\n"
      "    if (x > 0) {\n"
      "      return 1\n"
      "    }\n"
      "    return 0\n"
      "  }\n"
      "\n"
      "  fun baz() = listOf(\n"
      "      1,\n"
      "      2)\n"
      "}\n");
}

SourceFile java_file() {
  return test::make_source_file(
      "Foo.java",
      "public class Foo {\n"
      "  @Override\n"
      "  public void onCreate(Bundle state) {\n"
      "    String s = get(1);\n"
      "    if (s != null) {\n"
      "      use(s);\n"
      "    }\n"
      "  }\n"
      "  abstract int size();\n"
      "}\n");
}

} // namespace

class LineScanningTest : public test::Test {};

TEST_F(LineScanningTest, FindBlock) {
  auto file = kotlin_file();

  auto block = scanning::find_block(file, 2, /* max_lines */ 1);
  ASSERT_TRUE(block);
  EXPECT_EQ(block->start, 2);
  EXPECT_EQ(block->end, 7);
  EXPECT_TRUE(block->contains(4));
  EXPECT_FALSE(block->contains(8));

  block = scanning::find_block(file, 3, /* max_lines */ 1);
  ASSERT_TRUE(block);
  EXPECT_EQ(block->start, 3);
  EXPECT_EQ(block->end, 5);

  block = scanning::find_block(file, 1, /* max_lines */ 1);
  ASSERT_TRUE(block);
  EXPECT_EQ(block->end, 12);

  // The opening brace must be within `max_lines`.
  EXPECT_FALSE(scanning::find_block(file, 4, /* max_lines */ 1));
  block = scanning::find_block(file, 4, /* max_lines */ 3);
  EXPECT_FALSE(block);
  EXPECT_FALSE(scanning::find_block(file, 13, /* max_lines */ 1));
}

TEST_F(LineScanningTest, FindBlockFromColumn) {
  auto file = test::make_source_file(
      "Foo.kt", "val a = listOf(1).map { it + 1 }.filter {\n  it > 0\n}\n");

  auto block = scanning::find_block(file, 1, /* max_lines */ 1);
  ASSERT_TRUE(block);
  EXPECT_EQ(block->start, 1);
  EXPECT_EQ(block->end, 1);

  block = scanning::find_block(
      file, 1, /* max_lines */ 1, /* column */ file.code(1).find("filter"));
  ASSERT_TRUE(block);
  EXPECT_EQ(block->start, 1);
  EXPECT_EQ(block->end, 3);
}

TEST_F(LineScanningTest, FindBlockIgnoresBracesInLiterals) {
  auto file = test::make_source_file(
      "Foo.kt",
      "fun f() {\n"
      "  log(\"}\")\n"
      "  // }\n"
      "}\n");
  auto block = scanning::find_block(file, 1, /* max_lines */ 1);
  ASSERT_TRUE(block);
  EXPECT_EQ(block->end, 4);
}

TEST_F(LineScanningTest, UnbalancedBlock) {
  auto file = test::make_source_file("Foo.kt", "fun f() {\n  g()\n");
  EXPECT_FALSE(scanning::find_block(file, 1, /* max_lines */ 1));
}

TEST_F(LineScanningTest, DeclaredMethodName) {
  auto kotlin = kotlin_file();
  EXPECT_EQ(scanning::declared_method_name(kotlin, 1), std::nullopt);
  EXPECT_EQ(scanning::declared_method_name(kotlin, 2), "bar");
  EXPECT_EQ(scanning::declared_method_name(kotlin, 3), std::nullopt);
  EXPECT_EQ(scanning::declared_method_name(kotlin, 9), "baz");

  auto extension = test::make_source_file(
      "Foo.kt", "private fun <T> List<T>.second(): T = this[1]\n");
  EXPECT_EQ(scanning::declared_method_name(extension, 1), "second");

  auto java = java_file();
  EXPECT_EQ(scanning::declared_method_name(java, 1), std::nullopt);
  EXPECT_EQ(scanning::declared_method_name(java, 2), std::nullopt);
  EXPECT_EQ(scanning::declared_method_name(java, 3), "onCreate");
  EXPECT_EQ(scanning::declared_method_name(java, 4), std::nullopt);
  EXPECT_EQ(scanning::declared_method_name(java, 5), std::nullopt);
  EXPECT_EQ(scanning::declared_method_name(java, 6), std::nullopt);
  EXPECT_EQ(scanning::declared_method_name(java, 9), "size");

  auto statements = test::make_source_file(
      "Foo.java",
      "    return compute(x);\n"
      "    throw new IllegalStateException(message);\n"
      "    } else if (ready(x)) {\n"
      "  private Foo(int x) {\n");
  EXPECT_EQ(scanning::declared_method_name(statements, 1), std::nullopt);
  EXPECT_EQ(scanning::declared_method_name(statements, 2), std::nullopt);
  EXPECT_EQ(scanning::declared_method_name(statements, 3), std::nullopt);
  EXPECT_EQ(scanning::declared_method_name(statements, 4), "Foo");
}

TEST_F(LineScanningTest, FindEnclosingMethod) {
  auto kotlin = kotlin_file();

  auto method = scanning::find_enclosing_method(kotlin, 4, 400);
  ASSERT_TRUE(method);
  EXPECT_EQ(method->name, "bar");
  EXPECT_EQ(method->declaration, 2);
  EXPECT_EQ(method->end, 7);
  ASSERT_TRUE(method->body);
  EXPECT_EQ(method->body->start, 2);
  EXPECT_EQ(method->body->end, 7);

  // Expression body.
  method = scanning::find_enclosing_method(kotlin, 10, 400);
  ASSERT_TRUE(method);
  EXPECT_EQ(method->name, "baz");
  EXPECT_EQ(method->declaration, 9);
  EXPECT_EQ(method->end, 11);
  EXPECT_FALSE(method->body);

  // Between methods.
  EXPECT_FALSE(scanning::find_enclosing_method(kotlin, 8, 400));
  EXPECT_FALSE(scanning::find_enclosing_method(kotlin, 12, 400));

  // The declaration is out of reach.
  EXPECT_FALSE(scanning::find_enclosing_method(kotlin, 6, 2));

  auto java = java_file();
  method = scanning::find_enclosing_method(java, 6, 400);
  ASSERT_TRUE(method);
  EXPECT_EQ(method->name, "onCreate");
  EXPECT_EQ(method->declaration, 3);
  EXPECT_EQ(method->end, 8);

  // Abstract methods have no body.
  EXPECT_FALSE(scanning::find_enclosing_method(java, 9, 400));
}

TEST_F(LineScanningTest, FindEnclosingMethodWithoutMethod) {
  auto file = test::make_source_file(
      "Main.kt", "val x: String? = null\nx.length()\n");
  EXPECT_FALSE(scanning::find_enclosing_method(file, 2, 400));
}

TEST_F(LineScanningTest, Windows) {
  auto file = test::make_source_file(
      "Foo.kt",
      "val a = 1\n"
      "// guard != null\n"
      "if (b != null) {\n"
      "  b.run()\n"
      "}\n");
  re2::RE2 pattern("!= null");

  EXPECT_TRUE(scanning::lookback_contains(file, 4, 1, pattern));
  EXPECT_FALSE(scanning::lookback_contains(file, 4, 0, pattern));
  EXPECT_TRUE(scanning::lookback_contains(file, 3, 0, pattern));
  // Comments are not code.
  EXPECT_FALSE(scanning::window_contains(file, 2, 0, 0, pattern));
  EXPECT_TRUE(scanning::window_contains(file, 1, 0, 2, pattern));
  EXPECT_FALSE(scanning::window_contains(file, 1, 0, 1, pattern));
  // Windows are clipped to the file.
  EXPECT_TRUE(scanning::window_contains(file, 5, 100, 100, pattern));

  EXPECT_FALSE(
      scanning::block_contains(file, scanning::Block{4, 5}, pattern));
  EXPECT_TRUE(
      scanning::block_contains(file, scanning::Block{1, 3}, pattern));
}

TEST_F(LineScanningTest, AccumulateCall) {
  auto file = test::make_source_file(
      "Dao.kt",
      "db.rawQuery(\"SELECT * FROM t WHERE id = \" +\n"
      "    id, null)\n"
      "foo(bar(\n");

  auto call = scanning::accumulate_call(file, 1, 0, /* max_lines */ 20);
  ASSERT_TRUE(call);
  EXPECT_EQ(call->start, 1);
  EXPECT_EQ(call->end, 2);
  EXPECT_EQ(call->end_column, 12);
  EXPECT_EQ(call->text, "(\"SELECT * FROM t WHERE id = \" + id, null)");
  EXPECT_EQ(call->code.size(), call->text.size());
  EXPECT_EQ(call->code.find("SELECT"), std::string::npos);
  EXPECT_NE(call->code.find("+ id, null)"), std::string::npos);

  // Unbalanced within the limit.
  EXPECT_FALSE(scanning::accumulate_call(file, 1, 0, /* max_lines */ 1));
  EXPECT_FALSE(scanning::accumulate_call(file, 3, 0, /* max_lines */ 20));
  // No parenthesis after the column.
  EXPECT_FALSE(scanning::accumulate_call(file, 2, 13, /* max_lines */ 20));
}

TEST_F(LineScanningTest, AccumulateCallOnOneLine) {
  auto file = test::make_source_file(
      "Main.java", "int x = Integer.parseInt(text.trim()) + 1;\n");
  auto call = scanning::accumulate_call(
      file, 1, file.code(1).find("parseInt"), /* max_lines */ 20);
  ASSERT_TRUE(call);
  EXPECT_EQ(call->text, "(text.trim())");
  EXPECT_EQ(call->end, 1);
  EXPECT_EQ(file.code(1)[call->end_column], ')');
  EXPECT_EQ(file.code(1).substr(call->end_column + 1), " + 1;");
}

TEST_F(LineScanningTest, TryCoverage) {
  auto file = test::make_source_file(
      "Foo.kt",
      "fun f() {\n"
      "  val a = parse(x)\n"
      "  try {\n"
      "    val b = parse(y)\n"
      "  } catch (e: Exception) {\n"
      "    log(e)\n"
      "  }\n"
      "  val c = runCatching { parse(z) }\n"
      "  val d = parse(w)\n"
      "}\n");

  auto covered = scanning::try_coverage(file);
  ASSERT_EQ(covered.size(), 11);
  EXPECT_FALSE(covered[1]);
  EXPECT_FALSE(covered[2]);
  EXPECT_TRUE(covered[3]);
  EXPECT_TRUE(covered[4]);
  EXPECT_TRUE(covered[5]);
  EXPECT_FALSE(covered[6]);
  EXPECT_FALSE(covered[7]);
  EXPECT_TRUE(covered[8]);
  EXPECT_FALSE(covered[9]);
  EXPECT_FALSE(covered[10]);
}

TEST_F(LineScanningTest, TryWithResources) {
  auto file = test::make_source_file(
      "Foo.java",
      "void f() {\n"
      "  try (InputStream in =\n"
      "      new FileInputStream(path)) {\n"
      "    read(in);\n"
      "  }\n"
      "  read(other);\n"
      "}\n");

  auto covered = scanning::try_coverage(file);
  EXPECT_TRUE(covered[2]);
  EXPECT_TRUE(covered[3]);
  EXPECT_TRUE(covered[4]);
  EXPECT_FALSE(covered[6]);
}

TEST_F(LineScanningTest, TryWithoutBlock) {
  auto file = test::make_source_file(
      "Config.kt",
      "fun load() = runCatching(::readConfig)\n"
      "\n"
      "fun parse(s: String): Int {\n"
      "  JSONObject(s)\n"
      "  return Integer.parseInt(s)\n"
      "}\n"
      "val retry = try\n"
      "  {\n"
      "    parse(x)\n"
      "  } finally {}\n");

  auto covered = scanning::try_coverage(file);
  ASSERT_EQ(covered.size(), 11);
  for (std::size_t line = 1; line <= 6; line++) {
    EXPECT_FALSE(covered[line]) << "line " << line;
  }
  EXPECT_TRUE(covered[7]);
  EXPECT_TRUE(covered[8]);
  EXPECT_TRUE(covered[9]);
  EXPECT_TRUE(covered[10]);
}

TEST_F(LineScanningTest, MethodNames) {
  auto kotlin = scanning::method_names(kotlin_file());
  ASSERT_EQ(kotlin.size(), 13);
  EXPECT_EQ(kotlin[1], "");
  EXPECT_EQ(kotlin[2], "bar");
  EXPECT_EQ(kotlin[4], "bar");
  EXPECT_EQ(kotlin[7], "bar");
  EXPECT_EQ(kotlin[8], "");
  EXPECT_EQ(kotlin[9], "baz");
  EXPECT_EQ(kotlin[12], "");

  auto java = scanning::method_names(java_file());
  EXPECT_EQ(java[2], "");
  EXPECT_EQ(java[3], "onCreate");
  EXPECT_EQ(java[6], "onCreate");
  EXPECT_EQ(java[8], "onCreate");
  EXPECT_EQ(java[10], "");
}

TEST_F(LineScanningTest, MethodNamesWithNestedClasses) {
  auto file = test::make_source_file(
      "Foo.kt",
      "override fun onCreate(state: Bundle?) {\n"
      "  button.setOnClickListener(object : View.OnClickListener {\n"
      "    override fun onClick(view: View) {\n"
      "      load()\n"
      "    }\n"
      "  })\n"
      "  setup()\n"
      "}\n");

  auto names = scanning::method_names(file);
  EXPECT_EQ(names[1], "onCreate");
  EXPECT_EQ(names[2], "onCreate");
  EXPECT_EQ(names[4], "onClick");
  EXPECT_EQ(names[6], "onCreate");
  EXPECT_EQ(names[7], "onCreate");
}

} // namespace tracedroid
