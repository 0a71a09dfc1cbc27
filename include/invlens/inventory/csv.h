#pragma once

#include <string>
#include <vector>

namespace invlens::inventory {

// 解析一行 CSV (RFC 4180: 引号字段, "" 转义)
// 引号未闭合或闭合引号后紧跟非分隔符时返回 false
bool ParseCsvLine(const std::string& line, std::vector<std::string>* fields);

// %XX 与 '+' 解码; 非法转义返回 false
bool UrlDecode(const std::string& in, std::string* out);

} // namespace invlens::inventory
