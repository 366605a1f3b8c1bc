#include "parser.hpp"
#include "dns_question.hpp"
#include <regex>
#include <stdexcept>


std::optional<LogEntry> parse_query_event(const std::string &line, std::chrono::system_clock::time_point now){
static const std::regex r(R"(^\s*(\S+)\s+(\S+)(?:\s+(?!ok\b|blocked\b)([A-Za-z][A-Za-z0-9]*))?(?:\s+(ok|blocked)(?::(\S+))?)?(?:\s+(\d{1,12}))?\s*$)");
std::smatch m;
if(!std::regex_match(line, m, r)) return std::nullopt;

uint16_t qtype = kQTypeA;
if(m[3].matched){
qtype = qtype_from_string(m[3].str());
if(qtype == 0) return std::nullopt;
}
// a rule only makes sense on a block
if(m[5].matched && m[4].str() != "blocked") return std::nullopt;

LogEntry e;
try{
e.question = build_query(m[2].str(), qtype);
}catch(const std::invalid_argument &){
return std::nullopt;
}
e.time = now;
e.client = m[1].str();
if(m[4].matched && m[4].str() == "blocked"){
e.result.filtered = true;
e.result.reason = FilterReason::FilteredBlackList;
if(m[5].matched) e.result.rule = m[5].str();
}
if(m[6].matched){
e.elapsed = std::chrono::microseconds(std::stoll(m[6].str()));
}
return e;
}
