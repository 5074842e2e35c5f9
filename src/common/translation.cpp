/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   translation, locale handling
*/

#include "common/common_pch.h"

#include <clocale>

#include "common/fs_sys_helpers.h"
#include "common/strings/formatting.h"
#include "common/translation.h"

translatable_string_c::translatable_string_c(const std::string &untranslated_string)
  : m_untranslated_strings{untranslated_string}
{
}

translatable_string_c::translatable_string_c(const char *untranslated_string)
  : m_untranslated_strings{std::string{untranslated_string}}
{
}

translatable_string_c::translatable_string_c(std::vector<translatable_string_c> const &untranslated_strings)
{
  for (auto const &untranslated_string : untranslated_strings)
    m_untranslated_strings.emplace_back(untranslated_string.get_untranslated());
}

std::string
translatable_string_c::get_translated()
  const
{
  if (m_overridden_by)
    return *m_overridden_by;

  std::vector<std::string> translated_strings;
  for (auto const &untranslated_string : m_untranslated_strings)
    if (!untranslated_string.empty())
      translated_strings.emplace_back(gettext(untranslated_string.c_str()));

  return join(translated_strings);
}

std::string
translatable_string_c::get_untranslated()
  const
{
  return join(m_untranslated_strings);
}

translatable_string_c &
translatable_string_c::override(std::string const &by) {
  m_overridden_by = by;
  return *this;
}

std::string
translatable_string_c::join(std::vector<std::string> const &strings)
  const {
  return vmx::string::join(strings, " ");
}

// ------------------------------------------------------------

#if defined(HAVE_LIBINTL_H)

void
init_locales(std::string locale) {
  auto debug = debugging_c::requested("locale");

  mxdebug_if(debug, fmt::format("[init_locales start: locale {0}]\n", locale));

  std::string chosen_locale;

  if (!locale.empty() && setlocale(LC_MESSAGES, locale.c_str()))
    chosen_locale = locale;

  else if (setlocale(LC_MESSAGES, ""))
    chosen_locale = setlocale(LC_MESSAGES, nullptr);

  // Hard fallback to "C" locale if no suitable locale was
  // selected.
  if (chosen_locale.empty() && setlocale(LC_MESSAGES, "C"))
    chosen_locale = "C";

  mxdebug_if(debug, fmt::format("[init_locales chosen locale {0}]\n", chosen_locale));

  auto locale_dir = vmx::sys::get_installation_path() / ".." / "share" / "locale";

  mxdebug_if(debug, fmt::format("[init_locales locale_dir: {0}]\n", locale_dir.string()));

  bindtextdomain("vidmix", locale_dir.string().c_str());
  textdomain("vidmix");
  bind_textdomain_codeset("vidmix", "UTF-8");
}

#else  // HAVE_LIBINTL_H

void
init_locales(std::string) {
}

#endif  // HAVE_LIBINTL_H
