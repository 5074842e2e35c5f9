/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   definitions used by Qt GUIs
*/

#pragma once

#include <QString>
#include <QStringList>

#define Q(s)  to_qs(s)
#define QH(s)  to_qs(s).toHtmlEscaped()
#define QY(s) to_qs(Y(s))
#define QNY(singular, plural, count) to_qs(NY(singular, plural, count))

inline QChar
to_qs(char const source) {
  return QChar{source};
}

inline QString
to_qs(QString const &source) {
  return source;
}

inline QString
to_qs(char const *source) {
  return QString{source};
}

inline QString
to_qs(std::string const &source) {
  return QString::fromUtf8(source.c_str());
}

inline QString
to_qs(std::wstring const &source) {
  return QString::fromStdWString(source);
}

inline QString
to_qs(boost::filesystem::path const &source) {
  return to_qs(source.string());
}

inline QStringList
to_qs(std::vector<std::string> const &source) {
  QStringList result;
  for (auto const &string : source)
    result << to_qs(string);
  return result;
}

inline std::string
to_utf8(QString const &source) {
  return std::string{ source.toUtf8().data() };
}

inline std::vector<std::string>
to_utf8(QStringList const &source) {
  std::vector<std::string> result;
  for (auto const &string : source)
    result.emplace_back(to_utf8(string));
  return result;
}

inline std::ostream &
operator <<(std::ostream &out,
            QString const &string) {
  out << std::string{string.toUtf8().data()};
  return out;
}

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<QString> : ostream_formatter {};
#endif  // FMT_VERSION >= 90000
