#pragma once

#include "core/types.hpp"
#include "role_gateway.hpp"
#include <map>
#include <string>

namespace f0rge::workflow {

// prompt templates per role; {goal} and the other placeholders are filled by literal
// substitution and unknown placeholders are left as written
class prompt_book {
public:
  prompt_book();

  static prompt_book defaults();

  void set(role who, std::string text);
  const std::string& get(role who) const;

  std::string render(role who, const param_map& fields) const;

private:
  std::map<role, std::string> templates_;
};

} // namespace f0rge::workflow
