#include "runtime/response_cache/ollama_embedder.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;

namespace switchyard {

OllamaEmbedder::OllamaEmbedder(std::string base_url, std::string model,
                               int timeout_ms, PostFn post)
    : model_(std::move(model)), post_(std::move(post)) {
  while (!base_url.empty() && base_url.back() == '/') {
    base_url.pop_back();
  }
  endpoint_ = base_url + "/api/embeddings";
  if (!post_) {
    client_ = std::make_shared<HttpClient>(timeout_ms);
    auto client = client_;
    post_ = [client](const std::string &url, const std::string &body) {
      return client->Post(url, body);
    };
  }
}

std::vector<float> OllamaEmbedder::Embed(const std::string &text) {
  json request;
  request["model"] = model_;
  request["prompt"] = text;

  auto response = post_(endpoint_, request.dump());
  if (response.status != 200) {
    throw std::runtime_error("embedding request failed with status " +
                             std::to_string(response.status));
  }
  try {
    auto body = json::parse(response.body);
    auto embedding = body.at("embedding").get<std::vector<float>>();
    if (embedding.empty()) {
      throw std::runtime_error("embedding response is empty");
    }
    return embedding;
  } catch (const json::exception &ex) {
    throw std::runtime_error(std::string("malformed embedding response: ") +
                             ex.what());
  }
}

} // namespace switchyard
