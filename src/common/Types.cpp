#include "common/Types.hpp"

#include <stdexcept>
#include <utility>

namespace dyndns::common {

namespace {

std::string trim(const std::string& sValue) {
  const auto iStart = sValue.find_first_not_of(" \t");
  if (iStart == std::string::npos) {
    return {};
  }
  const auto iEnd = sValue.find_last_not_of(" \t");
  return sValue.substr(iStart, iEnd - iStart + 1);
}

}  // namespace

std::string toString(RecordType rtType) {
  switch (rtType) {
    case RecordType::A:
      return "A";
    case RecordType::AAAA:
      return "AAAA";
  }
  throw std::logic_error("unknown RecordType");
}

AllowList::AllowList(Mode mode, std::set<std::string> setDomains)
    : _mode(mode), _setDomains(std::move(setDomains)) {}

AllowList AllowList::unrestricted() { return AllowList(Mode::Unrestricted, {}); }

AllowList AllowList::restricted(std::set<std::string> setDomains) {
  // An empty list restricts nothing.
  if (setDomains.empty()) {
    return unrestricted();
  }
  return AllowList(Mode::Restricted, std::move(setDomains));
}

AllowList AllowList::parse(const std::string& sValue) {
  const std::string sTrimmed = trim(sValue);
  if (sTrimmed.empty() || sTrimmed == "false" || sTrimmed == "*") {
    return unrestricted();
  }

  std::set<std::string> setDomains;
  std::size_t iPos = 0;
  while (iPos <= sTrimmed.size()) {
    auto iComma = sTrimmed.find(',', iPos);
    if (iComma == std::string::npos) {
      iComma = sTrimmed.size();
    }
    const std::string sItem = trim(sTrimmed.substr(iPos, iComma - iPos));
    if (sItem.empty()) {
      throw std::runtime_error(
          "Allowed domains must be a comma-separated list of domains or 'false' "
          "to allow all domains (got '" + sValue + "')");
    }
    setDomains.insert(sItem);
    iPos = iComma + 1;
  }

  return restricted(std::move(setDomains));
}

bool AllowList::permits(const std::string& sDomain) const {
  if (_mode == Mode::Unrestricted) {
    return true;
  }
  return _setDomains.count(sDomain) > 0;
}

}  // namespace dyndns::common
