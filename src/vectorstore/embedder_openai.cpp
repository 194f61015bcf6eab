#include "conductor/vectorstore/embedder_openai.hpp"

#include "conductor/common/json_util.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace conductor::vectorstore {

namespace {

using Matrix = std::vector<std::vector<float>>;

common::Result<std::vector<float>> parse_float_array(const std::string &array_json) {
  std::vector<float> values;
  std::size_t pos = 1;
  while (pos < array_json.size()) {
    pos = common::json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    float value = 0.0F;
    const char *begin = array_json.data() + pos;
    const char *end = array_json.data() + array_json.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc()) {
      return common::Result<std::vector<float>>::failure("invalid embedding value");
    }
    values.push_back(value);
    pos += static_cast<std::size_t>(ptr - begin);
  }
  return common::Result<std::vector<float>>::success(std::move(values));
}

} // namespace

common::Result<Matrix> parse_embedding_response(const std::string &body) {
  const std::string data = common::json_get_array(body, "data");
  if (data.empty()) {
    return common::Result<Matrix>::failure("data field missing");
  }

  std::vector<std::pair<long, std::vector<float>>> indexed;
  for (const auto &item : common::json_split_top_level_objects(data)) {
    const std::string array = common::json_get_array(item, "embedding");
    if (array.empty()) {
      return common::Result<Matrix>::failure("embedding field missing");
    }
    auto parsed = parse_float_array(array);
    if (!parsed.ok()) {
      return common::Result<Matrix>::failure(parsed.status());
    }
    const std::string index_text = common::json_get_number(item, "index");
    long index = 0;
    const auto [_, ec] =
        std::from_chars(index_text.data(), index_text.data() + index_text.size(), index);
    if (ec != std::errc()) {
      index = static_cast<long>(indexed.size());
    }
    indexed.emplace_back(index, std::move(parsed.value()));
  }
  std::stable_sort(indexed.begin(), indexed.end(),
                   [](const auto &lhs, const auto &rhs) { return lhs.first < rhs.first; });

  Matrix out;
  out.reserve(indexed.size());
  for (auto &[_, values] : indexed) {
    out.push_back(std::move(values));
  }
  return common::Result<Matrix>::success(std::move(out));
}

OpenAiEmbedder::OpenAiEmbedder(std::string api_key, std::string model, const std::size_t dimensions,
                               std::string base_url,
                               std::shared_ptr<providers::HttpClient> http_client)
    : api_key_(std::move(api_key)), model_(std::move(model)), name_("openai:" + model_),
      dimensions_(dimensions), base_url_(std::move(base_url)),
      http_client_(std::move(http_client)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string_view OpenAiEmbedder::name() const { return name_; }

std::size_t OpenAiEmbedder::dimensions() const { return dimensions_; }

common::Result<std::string> OpenAiEmbedder::post(const std::string &input_json) {
  if (api_key_.empty()) {
    return common::Result<std::string>::failure("missing API key", common::ErrorKind::Validation);
  }
  std::ostringstream body;
  body << "{\"model\":\"" << common::json_escape(model_) << "\",\"input\":" << input_json
       << ",\"dimensions\":" << dimensions_ << "}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };
  const auto response = http_client_->post_json(base_url_ + "/embeddings", headers, body.str(),
                                                30'000);
  if (response.timeout) {
    return common::Result<std::string>::failure("embedding request timed out");
  }
  if (response.network_error) {
    return common::Result<std::string>::failure(response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Result<std::string>::failure("embedding API error status=" +
                                                std::to_string(response.status));
  }
  return common::Result<std::string>::success(response.body);
}

common::Result<std::vector<float>> OpenAiEmbedder::embed(const std::string_view text) {
  auto batch = embed_batch({std::string(text)});
  if (!batch.ok()) {
    return common::Result<std::vector<float>>::failure(batch.status());
  }
  return common::Result<std::vector<float>>::success(std::move(batch.value().front()));
}

common::Result<Matrix> OpenAiEmbedder::embed_batch(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return common::Result<Matrix>::success({});
  }
  auto body = post(common::json_string_array(texts));
  if (!body.ok()) {
    return common::Result<Matrix>::failure(body.status());
  }
  auto parsed = parse_embedding_response(body.value());
  if (!parsed.ok()) {
    return parsed;
  }
  if (parsed.value().size() != texts.size()) {
    return common::Result<Matrix>::failure("embedding count mismatch");
  }
  for (auto &values : parsed.value()) {
    values.resize(dimensions_, 0.0F);
  }
  return parsed;
}

} // namespace conductor::vectorstore
