/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_set>

#include <trace-droid/LineScanning.h>

namespace tracedroid {
namespace scanning {

namespace {

// Maximum number of lines between a declaration and its opening brace.
constexpr std::size_t k_max_header_lines = 20;

const re2::RE2 k_kotlin_function(
    R"(\bfun\s+(?:<[^>]*>\s*)?(?:[\w.?<>]+\.)?(\w+)\s*\()");

const re2::RE2 k_java_method(
    R"(^\s*(?:@\w+(?:\([^)]*\))?\s+)*)"
    R"((?:(?:public|protected|private|static|final|abstract|synchronized|native|default|strictfp)\s+)*)"
    R"((?:<[^>]*>\s+)?([\w.]+(?:<[^()]*>)?(?:\[\])*)\s+(\w+)\s*\()");

const re2::RE2 k_java_constructor(
    R"(^\s*(?:public|protected|private)\s+(\w+)\s*\()");

const std::unordered_set<std::string_view> k_not_a_type = {
    "return",
    "new",
    "throw",
    "else",
    "case",
    "package",
    "import",
    "assert",
    "yield",
};

const std::unordered_set<std::string_view> k_not_a_method = {
    "if",
    "for",
    "while",
    "switch",
    "catch",
    "synchronized",
    "return",
    "new",
    "when",
};

bool is_identifier_character(char character) {
  return std::isalnum(static_cast<unsigned char>(character)) ||
      character == '_';
}

/* Returns true if the `=` at `index` is an assignment, not a comparison. */
bool is_single_equal(const std::string& code, std::size_t index) {
  if (index + 1 < code.size() &&
      (code[index + 1] == '=' || code[index + 1] == '>')) {
    return false;
  }
  if (index > 0) {
    char previous = code[index - 1];
    if (previous == '=' || previous == '!' || previous == '<' ||
        previous == '>') {
      return false;
    }
  }
  return true;
}

std::size_t first_line_of_window(
    std::size_t line_number,
    std::size_t before) {
  return line_number > before ? line_number - before : 1;
}

/**
 * First non-blank character of the code view at or after `index` on
 * `line_number`, looking at most `k_max_header_lines` ahead. Returns `'\0'`
 * when there is none.
 */
char next_significant_character(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t index) {
  auto last = std::min(file.size(), line_number + k_max_header_lines);
  for (auto current = line_number; current <= last; current++) {
    const auto& code = file.code(current);
    for (auto position = current == line_number ? index : 0;
         position < code.size();
         position++) {
      if (!std::isspace(static_cast<unsigned char>(code[position]))) {
        return code[position];
      }
    }
  }
  return '\0';
}

/**
 * Determine the shape of the method declared at `declaration`: the block of
 * its body, or the end of its expression body.
 */
std::optional<Method> method_at(
    const SourceFile& file,
    std::size_t declaration,
    const std::string& name) {
  int parentheses = 0;
  auto last_line = std::min(file.size(), declaration + k_max_header_lines);
  for (auto line_number = declaration; line_number <= last_line;
       line_number++) {
    const auto& code = file.code(line_number);
    for (std::size_t index = 0; index < code.size(); index++) {
      char character = code[index];
      if (character == '(') {
        parentheses++;
      } else if (character == ')') {
        parentheses--;
      } else if (parentheses > 0) {
        continue;
      } else if (character == '{') {
        auto body = find_block(
            file, line_number, /* max_lines */ 1, /* column */ index);
        if (!body) {
          return std::nullopt;
        }
        return Method{name, declaration, body->end, body};
      } else if (character == ';') {
        // Abstract or interface method.
        return std::nullopt;
      } else if (character == '=' && is_single_equal(code, index)) {
        // Expression body: ends where parentheses and braces balance.
        int depth = 0;
        auto expression_line = line_number;
        auto column = index + 1;
        for (; expression_line <= file.size(); expression_line++) {
          const auto& expression = file.code(expression_line);
          for (; column < expression.size(); column++) {
            char current = expression[column];
            if (current == '(' || current == '{' || current == '[') {
              depth++;
            } else if (current == ')' || current == '}' || current == ']') {
              depth--;
            }
          }
          column = 0;
          if (depth <= 0) {
            break;
          }
        }
        return Method{
            name,
            declaration,
            std::min(expression_line, file.size()),
            std::nullopt};
      }
    }
  }
  return std::nullopt;
}

} // namespace

std::optional<Block> find_block(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t max_lines,
    std::size_t column) {
  if (!file.has_line_number(line_number)) {
    return std::nullopt;
  }

  // Locate the opening brace.
  std::optional<std::size_t> start;
  auto search_end = std::min(
      file.size(), line_number + std::max<std::size_t>(max_lines, 1) - 1);
  for (auto current = line_number; current <= search_end && !start;
       current++) {
    const auto& code = file.code(current);
    auto position = code.find('{', current == line_number ? column : 0);
    if (position != std::string::npos) {
      start = current;
      column = position;
    }
  }
  if (!start) {
    return std::nullopt;
  }

  int depth = 0;
  for (auto current = *start; current <= file.size(); current++) {
    const auto& code = file.code(current);
    for (auto index = current == *start ? column : 0; index < code.size();
         index++) {
      if (code[index] == '{') {
        depth++;
      } else if (code[index] == '}') {
        depth--;
        if (depth == 0) {
          return Block{*start, current};
        }
      }
    }
  }
  return std::nullopt;
}

std::optional<std::string> declared_method_name(
    const SourceFile& file,
    std::size_t line_number) {
  if (!file.has_line_number(line_number)) {
    return std::nullopt;
  }
  const auto& code = file.code(line_number);

  std::string name;
  if (file.language() != Language::Java &&
      re2::RE2::PartialMatch(code, k_kotlin_function, &name)) {
    return name;
  }
  if (file.language() == Language::Kotlin) {
    return std::nullopt;
  }

  std::string type;
  if (re2::RE2::PartialMatch(code, k_java_method, &type, &name) &&
      k_not_a_type.count(type) == 0 && k_not_a_method.count(name) == 0) {
    return name;
  }
  if (re2::RE2::PartialMatch(code, k_java_constructor, &name) &&
      k_not_a_method.count(name) == 0) {
    return name;
  }
  return std::nullopt;
}

std::optional<Method> find_enclosing_method(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t search_limit) {
  if (!file.has_line_number(line_number)) {
    return std::nullopt;
  }

  auto first = first_line_of_window(line_number, search_limit);
  for (auto candidate = line_number; candidate >= first; candidate--) {
    if (auto name = declared_method_name(file, candidate)) {
      auto method = method_at(file, candidate, *name);
      if (method && method->contains(line_number)) {
        return method;
      }
    }
  }
  return std::nullopt;
}

bool window_contains(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t before,
    std::size_t after,
    const re2::RE2& pattern) {
  if (!file.has_line_number(line_number)) {
    return false;
  }
  auto last = std::min(file.size(), line_number + after);
  for (auto current = first_line_of_window(line_number, before);
       current <= last;
       current++) {
    if (re2::RE2::PartialMatch(file.code(current), pattern)) {
      return true;
    }
  }
  return false;
}

bool lookback_contains(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t before,
    const re2::RE2& pattern) {
  return window_contains(file, line_number, before, /* after */ 0, pattern);
}

bool block_contains(
    const SourceFile& file,
    const Block& block,
    const re2::RE2& pattern) {
  auto last = std::min(block.end, file.size());
  for (auto current = block.start; current <= last; current++) {
    if (re2::RE2::PartialMatch(file.code(current), pattern)) {
      return true;
    }
  }
  return false;
}

bool method_contains(
    const SourceFile& file,
    const Method& method,
    const re2::RE2& pattern) {
  return block_contains(file, Block{method.declaration, method.end}, pattern);
}

std::optional<Statement> accumulate_call(
    const SourceFile& file,
    std::size_t line_number,
    std::size_t column,
    std::size_t max_lines) {
  if (!file.has_line_number(line_number)) {
    return std::nullopt;
  }
  auto open = file.code(line_number).find('(', column);
  if (open == std::string::npos) {
    return std::nullopt;
  }

  Statement statement{line_number, line_number, open, "", ""};
  int depth = 0;
  auto last = std::min(file.size(), line_number + max_lines - 1);
  for (auto current = line_number; current <= last; current++) {
    const auto& raw = file.line(current);
    const auto& code = file.code(current);

    std::size_t begin = open;
    if (current != line_number) {
      begin = raw.find_first_not_of(" \t");
      if (begin == std::string::npos) {
        continue;
      }
      statement.text += ' ';
      statement.code += ' ';
    }

    for (auto index = current == line_number ? open : 0; index < code.size();
         index++) {
      if (code[index] == '(') {
        depth++;
      } else if (code[index] == ')') {
        depth--;
        if (depth == 0) {
          statement.text += raw.substr(begin, index - begin + 1);
          statement.code += code.substr(begin, index - begin + 1);
          statement.end = current;
          statement.end_column = index;
          return statement;
        }
      }
    }
    statement.text += raw.substr(begin);
    statement.code += code.substr(begin);
  }
  return std::nullopt;
}

std::vector<bool> try_coverage(const SourceFile& file) {
  std::vector<bool> covered(file.size() + 1, false);

  std::vector<int> try_depths;
  int depth = 0;
  // The next `{` opens a try block.
  bool block_expected = false;
  // The next `(` opens the resources of `try (...)`.
  bool resources_expected = false;
  int resource_depth = 0;

  for (std::size_t line_number = 1; line_number <= file.size();
       line_number++) {
    const auto& code = file.code(line_number);
    bool inside = !try_depths.empty() || resources_expected ||
        resource_depth > 0;

    std::size_t index = 0;
    while (index < code.size()) {
      char character = code[index];
      if (is_identifier_character(character)) {
        auto end = index;
        while (end < code.size() && is_identifier_character(code[end])) {
          end++;
        }
        auto token = std::string_view(code).substr(index, end - index);
        if (token == "try" || token == "runCatching") {
          auto next = next_significant_character(file, line_number, end);
          if (next == '{') {
            block_expected = true;
            inside = true;
          } else if (next == '(' && token == "try") {
            resources_expected = true;
            inside = true;
          }
        }
        index = end;
        continue;
      }
      if (character == '(') {
        if (resources_expected) {
          resources_expected = false;
          resource_depth = 1;
        } else if (resource_depth > 0) {
          resource_depth++;
        }
      } else if (character == ')') {
        if (resource_depth > 0 && --resource_depth == 0) {
          block_expected =
              next_significant_character(file, line_number, index + 1) ==
              '{';
        }
      } else if (character == '{') {
        if (block_expected) {
          try_depths.push_back(depth);
          block_expected = false;
          inside = true;
        }
        depth++;
      } else if (character == '}') {
        if (depth > 0) {
          depth--;
        }
        if (!try_depths.empty() && try_depths.back() == depth) {
          try_depths.pop_back();
        }
      }
      index++;
    }

    covered[line_number] = inside;
  }

  return covered;
}

std::vector<std::string> method_names(const SourceFile& file) {
  struct OpenMethod {
    std::string name;
    int depth;
  };

  std::vector<std::string> names(file.size() + 1);
  std::vector<OpenMethod> stack;
  std::optional<std::string> pending;
  std::size_t pending_since = 0;
  int depth = 0;
  int parentheses = 0;

  for (std::size_t line_number = 1; line_number <= file.size();
       line_number++) {
    const auto& code = file.code(line_number);
    std::string name = stack.empty() ? "" : stack.back().name;

    if (auto declared = declared_method_name(file, line_number)) {
      pending = declared;
      pending_since = line_number;
      parentheses = 0;
    } else if (pending && line_number - pending_since > k_max_header_lines) {
      pending = std::nullopt;
    }
    if (pending) {
      name = *pending;
    }

    for (std::size_t index = 0; index < code.size(); index++) {
      char character = code[index];
      if (character == '(') {
        parentheses++;
      } else if (character == ')') {
        parentheses--;
      } else if (character == '{') {
        if (pending && parentheses <= 0) {
          stack.push_back(OpenMethod{*pending, depth});
          name = *pending;
          pending = std::nullopt;
        }
        depth++;
      } else if (character == '}') {
        if (depth > 0) {
          depth--;
        }
        if (!stack.empty() && stack.back().depth == depth) {
          stack.pop_back();
        }
      } else if (pending && parentheses <= 0) {
        if (character == ';' ||
            (character == '=' && is_single_equal(code, index))) {
          // Abstract method or expression body.
          pending = std::nullopt;
        }
      }
    }

    names[line_number] = name;
  }

  return names;
}

} // namespace scanning
} // namespace tracedroid
