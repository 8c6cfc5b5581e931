#ifndef SITECHECK_CORE_CONFIG_H
#define SITECHECK_CORE_CONFIG_H

namespace sitecheck::core::config {

inline constexpr int kDefaultTimeoutMs = 10000;
inline constexpr const char kDefaultUserAgent[] = "sitecheck/0.1";
inline constexpr const char kProgramName[] = "sitecheck";
inline constexpr const char kVersionString[] = "sitecheck 0.1.0";

}  // namespace sitecheck::core::config

#endif  // SITECHECK_CORE_CONFIG_H
