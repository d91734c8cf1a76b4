#pragma once
#include <optional>
#include <string>
#include <vector>


namespace playbook {


// Simple string helpers
bool starts_with(const std::string& s, const std::string& p);
bool ends_with(const std::string& s, const std::string& suffix);
std::vector<std::string> split_paths(const std::string& s, char sep=':');


// $HOME, or nothing when unset/empty
std::optional<std::string> home_dir();

// "~" or "~/x" -> "$HOME" or "$HOME/x"; anything else is returned untouched
std::string expand_home(const std::string& path);

// inverse of expand_home: "$HOME/x" -> "~/x"
std::string contract_home(const std::string& path);


} // namespace playbook
