#include "Domain.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

#include <idn2.h>
#include <uninorm.h>

#include <fmt/format.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace RFC1035 {
using dot = one<'.'>;

// Looser than the LDH rule: service labels like "_25._tcp" and
// wildcard owners show up in real referrals.
struct label_char : sor<ALPHA, DIGIT, one<'-', '_', '*'>> {};

struct label : plus<label_char> {};

struct domain : seq<list<label, dot>, eof> {};
} // namespace RFC1035

namespace {
size_t constexpr max_length       = 255;
size_t constexpr max_label_length = 63;

bool is_ascii(std::string_view str)
{
  return std::all_of(begin(str), end(str), [](char ch) {
    return (static_cast<unsigned char>(ch) & 0x80) == 0;
  });
}

std::string_view remove_trailing_dot(std::string_view dom)
{
  if (dom.length() && dom.back() == '.')
    dom.remove_suffix(1);
  return dom;
}

std::string to_lower(std::string_view str)
{
  std::string ret(str);
  std::transform(begin(ret), end(ret), begin(ret), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return ret;
}

// Normalization Form KC (NFKC) Compatibility Decomposition, followed
// by Canonical Composition, see <http://unicode.org/reports/tr15/>

bool nfkc(std::string_view str, std::string& out)
{
  size_t     length = 0;
  auto const udata  = reinterpret_cast<uint8_t const*>(str.data());
  auto const norm
      = u8_normalize(UNINORM_NFKC, udata, str.size(), nullptr, &length);
  if (norm == nullptr)
    return false;
  out.assign(reinterpret_cast<char const*>(norm), length);
  std::free(norm);
  return true;
}

bool fail(bool should_throw, std::string& msg, std::string what)
{
  if (should_throw)
    throw std::invalid_argument(what);
  msg = std::move(what);
  return false;
}
} // namespace

bool Domain::set_(std::string_view dom, bool should_throw, std::string& msg)
{
  if (dom.length() > max_length) {
    return fail(should_throw, msg,
                fmt::format("domain name «{}» too long", dom));
  }

  // Every name we handle is fully qualified, the trailing dot carries
  // no information.
  dom = remove_trailing_dot(dom);

  if (dom.empty()) {
    ascii_.clear();
    utf8_.clear();
    return true;
  }

  std::string ascii;
  std::string utf8;

  if (is_ascii(dom)) {
    ascii = to_lower(dom);
  }
  else {
    std::string norm;
    if (!nfkc(dom, norm)) {
      return fail(should_throw, msg,
                  fmt::format("failed to normalize domain «{}»", dom));
    }

    // idn2_to_ascii_8z() converts (ASCII) to lower case

    char* ptr  = nullptr;
    auto  code = idn2_to_ascii_8z(norm.c_str(), &ptr, IDN2_TRANSITIONAL);
    if (code != IDN2_OK)
      return fail(should_throw, msg, idn2_strerror(code));
    ascii = ptr;
    idn2_free(ptr);

    ptr  = nullptr;
    code = idn2_to_unicode_8z8z(ascii.c_str(), &ptr, IDN2_TRANSITIONAL);
    if (code != IDN2_OK)
      return fail(should_throw, msg, idn2_strerror(code));
    utf8 = ptr;
    idn2_free(ptr);
  }

  if (ascii.length() > max_length) {
    return fail(should_throw, msg,
                fmt::format("domain name «{}» too long", dom));
  }

  std::vector<std::string> lbls;
  boost::algorithm::split(lbls, ascii, boost::algorithm::is_any_of("."));
  for (auto const& label : lbls) {
    if (label.length() > max_label_length) {
      return fail(should_throw, msg,
                  fmt::format("domain label «{}» too long", label));
    }
  }

  memory_input<> in{ascii.data(), ascii.size(), "domain"};
  if (!parse<RFC1035::domain>(in)) {
    return fail(should_throw, msg,
                fmt::format("failed to parse domain «{}»", dom));
  }

  ascii_ = std::move(ascii);
  utf8_  = std::move(utf8);
  return true;
}

std::vector<std::string> Domain::labels() const
{
  std::vector<std::string> ret;
  if (!is_root())
    boost::algorithm::split(ret, ascii_, boost::algorithm::is_any_of("."));
  return ret;
}

Domain Domain::parent() const
{
  Domain ret;
  auto const dot = ascii_.find('.');
  if (dot != std::string::npos)
    ret.ascii_ = ascii_.substr(dot + 1);
  return ret;
}

std::vector<Domain> Domain::ancestors() const
{
  std::vector<Domain> ret;
  for (auto dom = *this;; dom = dom.parent()) {
    ret.push_back(dom);
    if (dom.is_root())
      break;
  }
  return ret;
}

bool Domain::is_subdomain_of(Domain const& zone) const
{
  if (zone.is_root() || (ascii_ == zone.ascii_))
    return true;

  auto const& z = zone.ascii_;
  return (ascii_.length() > z.length()) &&
         (ascii_.compare(ascii_.length() - z.length(), z.length(), z) == 0) &&
         (ascii_[ascii_.length() - z.length() - 1] == '.');
}
