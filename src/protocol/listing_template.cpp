#include "protocol/listing_template.hpp"
#include <sstream>

namespace bucketd {
namespace protocol {

namespace {

const char* const PAGE_HEAD = R"(<html>
	<head>
		<meta charset="UTF-8">
		<style>
		.body {
			padding: 10px;
			font-family: sans-serif;
		}
		h3 {
			font-weight: normal;
		}
		.item {
			list-style: none;
			padding: 2px;
		}
		</style>
)";

} // namespace

std::string render_listing_page(const std::string& base_path, const std::vector<std::string>& names) {
  const std::string title = html_escape(base_path);

  std::ostringstream page;
  page << PAGE_HEAD
       << "\t\t<title>" << title << "</title>\n"
       << "\t</head>\n"
       << "\t<body>\n"
       << "\t\t<div class=\"body\">\n"
       << "\t\t\t<div class=\"title\"><h3>" << title << "</h3></div>\n";

  if (names.empty()) {
    page << "\t\t\t\t<div class=\"info\"><h3>Empty bucket.</h3></div>\n";
  } else {
    page << "\t\t\t<ul>\n";
    for (const auto& name : names) {
      page << "\t\t\t\t<div class=\"item\">\n"
           << "\t\t\t\t\t<li><a href=\"" << html_escape(join_path(base_path, name)) << "\">"
           << html_escape(name) << "</a></li>\n"
           << "\t\t\t\t</div>\n";
    }
    page << "\t\t\t</ul>\n";
  }

  page << "\t\t</div>\n"
       << "\t</body>\n"
       << "</html>";
  return page.str();
}

std::string html_escape(const std::string& text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':  escaped += "&amp;"; break;
      case '<':  escaped += "&lt;"; break;
      case '>':  escaped += "&gt;"; break;
      case '"':  escaped += "&#34;"; break;
      case '\'': escaped += "&#39;"; break;
      default:   escaped += c;
    }
  }
  return escaped;
}

std::string join_path(const std::string& base_path, const std::string& name) {
  if (!base_path.empty() && base_path.back() == '/') {
    return base_path + name;
  }
  return base_path + "/" + name;
}

} // namespace protocol
} // namespace bucketd
