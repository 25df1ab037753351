#pragma once

#include "navcache/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace navcache {

// Selector patterns a surface uses to locate state-bearing controls.
struct CaptureSelectors {
  std::vector<std::string> filters{
      "select[data-filter]", "input[data-filter]",
      "input[type=\"checkbox\"][data-filter]",
      "input[type=\"radio\"][data-filter]:checked"};
  std::vector<std::string> expanded_sections{
      "[data-expandable][data-expanded=\"true\"]", "[aria-expanded=\"true\"]",
      ".expanded[data-section-id]"};
  std::string search{"input[type=\"search\"], input[data-search]"};
  std::string forms{"form[data-persist]"};
};

// The rendering surface seen by the state manager. Each environment (DOM,
// native toolkit, headless) provides one implementation.
class IUiSurface {
public:
  virtual ~IUiSurface() = default;
  virtual PageState capture(const CaptureSelectors &selectors) = 0;
  virtual void apply_filters(const StateMap &filters) = 0;
  virtual void apply_expanded_sections(const std::vector<std::string> &ids) = 0;
  virtual void
  apply_form_data(const std::map<std::string, StateMap> &forms) = 0;
  virtual void apply_search_term(const std::string &term) = 0;
  virtual void apply_scroll(const ScrollPosition &pos) = 0;
};

class HeadlessSurface final : public IUiSurface {
public:
  PageState capture(const CaptureSelectors &) override { return {}; }
  void apply_filters(const StateMap &) override {}
  void apply_expanded_sections(const std::vector<std::string> &) override {}
  void apply_form_data(const std::map<std::string, StateMap> &) override {}
  void apply_search_term(const std::string &) override {}
  void apply_scroll(const ScrollPosition &) override {}
};

} // namespace navcache
