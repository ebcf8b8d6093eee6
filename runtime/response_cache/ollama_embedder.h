#pragma once

#include "net/http_client.h"
#include "runtime/response_cache/embedder.h"

#include <functional>
#include <memory>
#include <string>

namespace switchyard {

// Embedder backed by an Ollama server: POST {base_url}/api/embeddings with
// {"model": ..., "prompt": ...}. Transport errors, non-200 statuses and
// malformed bodies throw std::runtime_error.
class OllamaEmbedder : public Embedder {
public:
  // (url, body) -> response. Defaults to an HttpClient.
  using PostFn =
      std::function<HttpResponse(const std::string &, const std::string &)>;

  OllamaEmbedder(std::string base_url, std::string model,
                 int timeout_ms = 10000, PostFn post = {});

  std::vector<float> Embed(const std::string &text) override;
  std::string Name() const override { return "ollama:" + model_; }

  const std::string &endpoint() const { return endpoint_; }

private:
  std::string endpoint_;
  std::string model_;
  std::shared_ptr<HttpClient> client_;
  PostFn post_;
};

} // namespace switchyard
