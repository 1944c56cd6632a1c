#include "sandcell/language.hpp"

#include <algorithm>
#include <cctype>

namespace sandcell {

namespace {

struct ProfileRow {
  LanguageId id;
  const char* name;
  const char* image;
  FileNameRule rule;
  const char* file;
  const char* run;
  const char* input;
  bool compiled;
};

// clang-format off
constexpr ProfileRow kProfiles[kLanguageCount] = {
    {LanguageId::javascript, "javascript", "node:16-alpine", FileNameRule::fixed, "program.js",
     "node {dir}/{src}",
     "node {dir}/{src} < {dir}/input.txt", false},
    {LanguageId::python, "python", "python:3.9-alpine", FileNameRule::fixed, "program.py",
     "python3 {dir}/{src}",
     "python3 {dir}/{src} < {dir}/input.txt", false},
    {LanguageId::java, "java", "openjdk:11-jdk-slim", FileNameRule::java_public_class, "Main.java",
     "cd {dir} && javac {src} && java {stem}",
     "cd {dir} && javac {src} && java {stem} < input.txt", true},
    {LanguageId::cpp, "cpp", "gcc:latest", FileNameRule::fixed, "program.cpp",
     "cd {dir} && g++ -o program {src} && ./program",
     "cd {dir} && g++ -o program {src} && ./program < input.txt", true},
    {LanguageId::c, "c", "gcc:latest", FileNameRule::fixed, "program.c",
     "cd {dir} && gcc -o program {src} && ./program",
     "cd {dir} && gcc -o program {src} && ./program < input.txt", true},
    {LanguageId::go, "go", "golang:alpine", FileNameRule::fixed, "main.go",
     "cd {dir} && go run {src}",
     "cd {dir} && go run {src} < input.txt", true},
    {LanguageId::ruby, "ruby", "ruby:alpine", FileNameRule::fixed, "program.rb",
     "ruby {dir}/{src}",
     "ruby {dir}/{src} < {dir}/input.txt", false},
    {LanguageId::rust, "rust", "rust:slim", FileNameRule::fixed, "main.rs",
     "cd {dir} && rustc -o program {src} && ./program",
     "cd {dir} && rustc -o program {src} && ./program < input.txt", true},
    {LanguageId::php, "php", "php:cli-alpine", FileNameRule::fixed, "program.php",
     "php {dir}/{src}",
     "php {dir}/{src} < {dir}/input.txt", false},
    {LanguageId::shell, "shell", "alpine:latest", FileNameRule::fixed, "program.sh",
     "sh {dir}/{src}",
     "sh {dir}/{src} < {dir}/input.txt", false},
    {LanguageId::html, "html", "nginx:alpine", FileNameRule::fixed, "index.html",
     "echo 'HTML files are for preview only'",
     "echo 'HTML files are for preview only'", false},
};
// clang-format on

bool is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// Plain words pass unchanged; anything else is single-quoted for sh.
std::string shell_word(const std::string& s) {
  const bool plain = !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '/' || c == '-';
  });
  if (plain) return s;
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += '\'';
  return out;
}

// Copy of source with comments and string/char literals blanked out.
std::string strip_comments_and_literals(std::string_view s) {
  std::string out(s.size(), ' ');
  size_t i = 0;
  while (i < s.size()) {
    const char c = s[i];
    if (c == '/' && i + 1 < s.size() && s[i + 1] == '/') {
      while (i < s.size() && s[i] != '\n') ++i;
    } else if (c == '/' && i + 1 < s.size() && s[i + 1] == '*') {
      i += 2;
      while (i + 1 < s.size() && !(s[i] == '*' && s[i + 1] == '/')) ++i;
      i += 2;
    } else if (c == '"' || c == '\'') {
      ++i;
      while (i < s.size() && s[i] != c) {
        if (s[i] == '\\') ++i;
        ++i;
      }
      ++i;
    } else {
      out[i] = c;
      ++i;
    }
  }
  return out;
}

std::vector<std::string> tokenize_words(const std::string& code) {
  std::vector<std::string> words;
  size_t i = 0;
  while (i < code.size()) {
    if (is_ident_start(code[i])) {
      size_t j = i + 1;
      while (j < code.size() && is_ident_char(code[j])) ++j;
      words.emplace_back(code.substr(i, j - i));
      i = j;
    } else {
      // Non-identifier punctuation separates declarations.
      if (!std::isspace(static_cast<unsigned char>(code[i]))) words.emplace_back(1, code[i]);
      ++i;
    }
  }
  return words;
}

bool is_class_modifier(const std::string& w) {
  return w == "final" || w == "abstract" || w == "static" || w == "strictfp" || w == "sealed";
}

}  // namespace

std::string to_string(LanguageId id) {
  return kProfiles[static_cast<size_t>(id)].name;
}

std::optional<LanguageId> parse_language(std::string_view name) {
  while (!name.empty() && std::isspace(static_cast<unsigned char>(name.front()))) name.remove_prefix(1);
  while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) name.remove_suffix(1);
  std::string lower;
  lower.reserve(name.size());
  for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  for (const auto& row : kProfiles) {
    if (lower == row.name) return row.id;
  }
  return std::nullopt;
}

std::optional<std::string> java_public_class(std::string_view source) {
  const auto words = tokenize_words(strip_comments_and_literals(source));
  for (size_t i = 0; i < words.size(); ++i) {
    if (words[i] != "public") continue;
    size_t j = i + 1;
    while (j < words.size() && is_class_modifier(words[j])) ++j;
    if (j + 1 < words.size() && words[j] == "class" && is_ident_start(words[j + 1][0])) {
      return words[j + 1];
    }
  }
  return std::nullopt;
}

std::string resolve_source_file_name(const LanguageProfile& profile, std::string_view source) {
  if (profile.file_name_rule == FileNameRule::java_public_class) {
    if (auto cls = java_public_class(source)) return *cls + ".java";
  }
  return profile.source_file_name;
}

std::string expand_command(const std::string& tmpl, const std::string& mount_dir,
                           const std::string& source_file) {
  const auto dot = source_file.rfind('.');
  const std::string stem = dot == std::string::npos ? source_file : source_file.substr(0, dot);

  std::string out;
  out.reserve(tmpl.size() + 32);
  size_t i = 0;
  while (i < tmpl.size()) {
    if (tmpl[i] == '{') {
      const auto close = tmpl.find('}', i);
      if (close != std::string::npos) {
        const auto key = std::string_view(tmpl).substr(i + 1, close - i - 1);
        if (key == "dir") { out += shell_word(mount_dir); i = close + 1; continue; }
        if (key == "src") { out += shell_word(source_file); i = close + 1; continue; }
        if (key == "stem") { out += shell_word(stem); i = close + 1; continue; }
      }
    }
    out += tmpl[i++];
  }
  return out;
}

LanguageRegistry::LanguageRegistry(const std::map<std::string, std::string>& image_overrides) {
  for (const auto& row : kProfiles) {
    LanguageProfile& p = profiles_[static_cast<size_t>(row.id)];
    p.id = row.id;
    p.image = row.image;
    p.file_name_rule = row.rule;
    p.source_file_name = row.file;
    p.run_command = row.run;
    p.input_command = row.input;
    p.interactive_command = "/bin/sh";
    p.compiled = row.compiled;
    p.needs_writable_workspace = row.compiled;
    if (auto it = image_overrides.find(row.name); it != image_overrides.end() && !it->second.empty()) {
      p.image = it->second;
    }
  }
}

const LanguageProfile* LanguageRegistry::lookup(std::string_view language, Error* error) const {
  auto id = parse_language(language);
  if (!id) {
    set_error(error, ErrorCode::unsupported_language, "unsupported language: " + std::string(language));
    return nullptr;
  }
  return &profiles_[static_cast<size_t>(*id)];
}

}  // namespace sandcell
