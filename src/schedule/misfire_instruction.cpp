#include "calsched/schedule/misfire_instruction.hpp"

#include "calsched/common/text.hpp"

#include <array>
#include <string_view>

namespace calsched::schedule::misfire {

namespace {

struct NamedInstruction {
  std::string_view folded;
  int code;
};

constexpr std::array<NamedInstruction, 9> kNames = {{
    {"ignoremisfirepolicy", kIgnoreMisfirePolicy},
    {"ignoremisfires", kIgnoreMisfirePolicy},
    {"smartpolicy", kSmartPolicy},
    {"smart", kSmartPolicy},
    {"fireoncenow", kFireOnceNow},
    {"fireandproceed", kFireOnceNow},
    {"donothing", kDoNothing},
    {"misfireinstructiondonothing", kDoNothing},
    {"misfireinstructionfireoncenow", kFireOnceNow},
}};

} // namespace

std::string instruction_name(const int code) {
  switch (code) {
  case kIgnoreMisfirePolicy:
    return "IgnoreMisfirePolicy";
  case kSmartPolicy:
    return "SmartPolicy";
  case kFireOnceNow:
    return "FireOnceNow";
  case kDoNothing:
    return "DoNothing";
  default:
    return "unknown(" + std::to_string(code) + ")";
  }
}

bool is_documented(const int code) {
  return code == kIgnoreMisfirePolicy || code == kSmartPolicy || code == kFireOnceNow ||
         code == kDoNothing;
}

common::Result<int> parse_instruction(const std::string &text) {
  if (auto raw = common::parse_int(text); raw.ok()) {
    return raw;
  }

  const std::string folded = common::fold_identifier(common::trim(text));
  for (const auto &entry : kNames) {
    if (folded == entry.folded) {
      return common::Result<int>::success(entry.code);
    }
  }
  return common::Result<int>::failure("unknown misfire instruction: " + text);
}

} // namespace calsched::schedule::misfire
