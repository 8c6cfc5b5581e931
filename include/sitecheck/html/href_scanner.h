#pragma once

#include <string>
#include <vector>

namespace sitecheck::html {

// Raw href values of every <a href> in document order, entity-decoded but
// otherwise untouched. Anchors without an href attribute are skipped, as is
// markup inside comments and raw-text elements such as <script>. Never
// fails: truncated markup yields whatever was complete.
std::vector<std::string> extract_hrefs(const std::string& html);

// Replaces character references (&amp;, &#38;, &#x26;) with their UTF-8
// text. Unknown or malformed references are kept as written.
std::string decode_entities(const std::string& text);

}  // namespace sitecheck::html
