#include "routing_advisor.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>

#include "internal/util/errors.hpp"

namespace graphflow::router {

namespace {

std::string Trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string StripPunctuation(std::string token) {
  while (!token.empty() && std::ispunct(static_cast<unsigned char>(token.back())) && token.back() != '_' && token.back() != '-') token.pop_back();
  while (!token.empty() && std::ispunct(static_cast<unsigned char>(token.front())) && token.front() != '_') token.erase(token.begin());
  return token;
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool IsCandidate(const std::string& token, const std::vector<std::string>& candidates) {
  return std::find(candidates.begin(), candidates.end(), token) != candidates.end();
}

// Candidate named on this line, if any.
std::optional<std::string> NamedCandidate(const std::string& line, const std::vector<std::string>& candidates) {
  auto trimmed = StripPunctuation(Trim(line));
  if (IsCandidate(trimmed, candidates)) return trimmed;

  std::istringstream       in(line);
  std::vector<std::string> tokens;
  for (std::string token; in >> token;) tokens.push_back(token);

  for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
    auto marker = Lower(tokens[i]);
    if (marker == "node:" || marker == "recommend" || marker == "recommend:" || marker == "target:" || marker == "next:") {
      auto candidate = StripPunctuation(tokens[i + 1]);
      if (IsCandidate(candidate, candidates)) return candidate;
    }
  }
  return std::nullopt;
}

} // namespace

std::string RoutingContext::Prompt() const {
  std::ostringstream out;
  out << "Choose the next workflow node.\n";
  out << "Current node: " << current_node << "\n";
  out << "Recent path:";
  for (const auto& node : recent_path) out << " " << node;
  out << "\nState keys:";
  for (const auto& key : data_keys) out << " " << key;
  out << "\nCandidates:\n";
  for (const auto& c : candidates) {
    out << "- to: " << c.to << " strategy: " << graph::RoutingStrategyName(c.strategy) << " score: " << c.score << "\n";
    if (!c.conditions.empty()) {
      out << "  conditions:";
      for (const auto& name : c.conditions) out << " [" << name << "]";
      out << "\n";
    }
    for (const auto& [key, value] : c.metadata) out << "  " << key << ": " << value << "\n";
  }
  out << "Answer with the node id on the first line, then your reasoning.\n";
  return out.str();
}

std::optional<Recommendation> ParseRecommendation(const std::string& text, const std::vector<std::string>& candidates) {
  std::istringstream in(text);
  std::string        line;
  while (std::getline(in, line)) {
    auto target = NamedCandidate(line, candidates);
    if (!target) continue;

    Recommendation rec;
    rec.target     = *target;
    rec.confidence = 1.0;
    std::string rest((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    rec.reasoning = Trim(rest.empty() ? line : rest);
    return rec;
  }
  return std::nullopt;
}

TextRoutingAdvisor::TextRoutingAdvisor(CompletionFn complete) : complete_(std::move(complete)) {
}

async::Future<Recommendation> TextRoutingAdvisor::Recommend(const RoutingContext& context) {
  std::vector<std::string> targets;
  for (const auto& c : context.candidates) targets.push_back(c.to);

  async::Promise<Recommendation> promise;
  async::Future<std::string>     completion;
  try {
    completion = complete_(context.Prompt());
  } catch (...) {
    promise.SetException(std::current_exception());
    return promise.GetFuture();
  }

  completion.OnComplete([promise, targets](const async::Future<std::string>& done) mutable {
    if (auto error = done.Error()) {
      promise.SetException(error);
      return;
    }
    auto rec = ParseRecommendation(done.Get(), targets);
    if (!rec) {
      promise.SetError(util::InvalidArgument("advisor response names no candidate"));
      return;
    }
    promise.SetValue(std::move(*rec));
  });
  return promise.GetFuture();
}

} // namespace graphflow::router
