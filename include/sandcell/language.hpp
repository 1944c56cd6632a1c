#pragma once

// sandcell/language.hpp - Language profile registry.
//
// DESIGN:
//   One immutable LanguageProfile per LanguageId, stored in a table indexed by
//   the enum. Adding a language is a data addition in language.cpp, never a new
//   branch in the executor or the terminal manager.
//
//   Commands are templates run through `sh -c` inside the environment:
//     {dir}   container mount path of the workspace (e.g. /code)
//     {src}   source file name (e.g. program.py, Greeter.java)
//     {stem}  source file name without extension (e.g. Greeter)
//
// INVARIANTS:
//   - lookup() of an unknown id is ErrorCode::unsupported_language. There is no
//     fallback profile.
//   - Profiles never change after the registry is constructed.

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sandcell/types.hpp"

namespace sandcell {

enum class LanguageId { javascript, python, java, cpp, c, go, ruby, rust, php, shell, html };

inline constexpr std::size_t kLanguageCount = 11;

std::string to_string(LanguageId id);

// Case-insensitive, surrounding whitespace ignored. nullopt for unknown ids.
std::optional<LanguageId> parse_language(std::string_view name);

enum class FileNameRule {
  fixed,              // source_file_name as-is
  java_public_class,  // <PublicClass>.java, else source_file_name
};

struct LanguageProfile {
  LanguageId id{LanguageId::shell};
  std::string image;
  FileNameRule file_name_rule{FileNameRule::fixed};
  std::string source_file_name;
  std::string run_command;          // stdin streamed to the program
  std::string input_command;        // stdin read from {dir}/input.txt
  std::string interactive_command;  // terminal shell, run as argv[0]
  bool compiled{false};
  bool needs_writable_workspace{false};
};

// Name of the first `public class X` declared outside comments and string
// literals. nullopt when there is none.
std::optional<std::string> java_public_class(std::string_view source);

// Applies the profile's file name rule to the submitted source.
std::string resolve_source_file_name(const LanguageProfile& profile, std::string_view source);

// Substitutes {dir}, {src} and {stem}. Values other than plain
// [A-Za-z0-9_./-] words are single-quoted, so a Java class such as A$B
// reaches the compiler intact.
std::string expand_command(const std::string& tmpl, const std::string& mount_dir,
                           const std::string& source_file);

class LanguageRegistry {
 public:
  // image_overrides: language id -> image, applied once here.
  explicit LanguageRegistry(const std::map<std::string, std::string>& image_overrides = {});

  const LanguageProfile* lookup(std::string_view language, Error* error) const;
  const LanguageProfile& get(LanguageId id) const { return profiles_[static_cast<std::size_t>(id)]; }
  const std::array<LanguageProfile, kLanguageCount>& list() const { return profiles_; }

 private:
  std::array<LanguageProfile, kLanguageCount> profiles_;
};

}  // namespace sandcell
