/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   definitions used in all programs, helper functions
*/

#pragma once

#undef min
#undef max

#include "common/os.h"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>
#if FMT_VERSION >= 110000
# include <fmt/ranges.h>
#endif // FMT_VERSION >= 110000

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>

namespace balg = boost::algorithm;

using namespace std::string_literals;

/* i18n stuff */
#if defined(HAVE_LIBINTL_H)
# include <libintl.h>
// libintl defines 'snprintf' to 'libintl_snprintf' on certain
// platforms such as mingw or macOS.  'std::snprintf' becomes
// 'std::libintl_snprintf' which doesn't exist.
# undef fprintf
# undef snprintf
# undef sprintf
#else
# define gettext(s)                            (s)
# define ngettext(s_singular, s_plural, count) ((count) != 1 ? (s_plural) : (s_singular))
#endif

#undef Y
#undef NY
#undef FY
#undef FNY
#define Y(s)                             gettext(s)
#define FY(s)                            fmt::runtime(gettext(s))
#define NY(s_singular, s_plural, count)  ngettext(s_singular, s_plural, count)
#define FNY(s_singular, s_plural, count) fmt::runtime(ngettext(s_singular, s_plural, count))

[[noreturn]]
void mxexit(int code = -1);

extern unsigned int verbose;

void vmx_common_init(std::string const &program_name, char const *argv0);
std::string const &get_program_name();

#define VMX_DECLARE_PRIVATE(PrivateClass) \
  inline PrivateClass* p_func() { return reinterpret_cast<PrivateClass *>(&(*p_ptr)); } \
  inline const PrivateClass* p_func() const { return reinterpret_cast<const PrivateClass *>(&(*p_ptr)); } \
  friend class PrivateClass;

#include "common/debugging.h"
#include "common/error.h"
#include "common/output.h"
