#include "trace.hpp"
#include "errors.hpp"
#include "text_util.hpp"

namespace cachesim {

static Addr parse_addr(const std::string& tok, std::size_t lineno) {
  if (tok.empty() || tok[0] == '-' || tok[0] == '+')
    throw TraceError("dirección inválida: '" + tok + "'", lineno);

  std::size_t used = 0;
  unsigned long long v = 0;
  try {
    if (tok.size() > 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X'))
      v = std::stoull(tok, &used, 16);
    else
      v = std::stoull(tok, &used, 10);
  } catch (const std::exception&) {
    throw TraceError("dirección inválida: '" + tok + "'", lineno);
  }
  if (used != tok.size())
    throw TraceError("dirección inválida: '" + tok + "'", lineno);
  return static_cast<Addr>(v);
}

std::optional<TraceRecord> parse_trace_line(const std::string& line, std::size_t lineno) {
  const auto s = text::trim(text::strip_comment(line));
  if (s.empty()) return std::nullopt;

  const auto tok = text::split_ws(s);
  if (tok.size() != 2)
    throw TraceError("se esperaba '<op> <addr>': " + s, lineno);
  if (tok[0].size() != 1)
    throw TraceError("operación inválida: '" + tok[0] + "'", lineno);

  TraceRecord r;
  r.op   = tok[0][0];
  r.addr = parse_addr(tok[1], lineno);
  r.line = lineno;
  return r;
}

std::vector<TraceRecord> parse_trace(std::istream& in) {
  std::vector<TraceRecord> out;
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    if (auto r = parse_trace_line(line, lineno)) out.push_back(*r);
  }
  return out;
}

} // namespace cachesim
