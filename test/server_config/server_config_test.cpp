#include "ServerConfig.hpp"
#include "Errors.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

class ServerConfigTest : public ::testing::Test {
protected:
  void SetUp() override {}
  void TearDown() override {}

  static std::vector<ServerDescriptor> two_servers() {
    return parse_server_config(R"(
servers:
  - server: "rbh101"
    shortname: "scout"
    openai_api_key: "${VLLM_API_KEY}"
    openai_api_base: "http://10.0.0.21:80/v1"
    openai_model: "scout"
  - shortname: "gpt41"
    openai_api_base: "https://api.openai.com/v1"
    openai_model: "gpt-4.1"
)");
  }
};

TEST_F(ServerConfigTest, ParsesEntriesInOrder) {
  auto servers = two_servers();

  ASSERT_EQ(servers.size(), 2);

  EXPECT_EQ(servers[0].id, "scout");
  EXPECT_EQ(servers[0].host_label, "rbh101");
  EXPECT_EQ(servers[0].api_base_url, "http://10.0.0.21:80/v1");
  EXPECT_EQ(servers[0].api_key_ref, "${VLLM_API_KEY}");
  EXPECT_EQ(servers[0].model_name, "scout");
  EXPECT_FALSE(servers[0].max_tokens.has_value());

  EXPECT_EQ(servers[1].id, "gpt41");
}

TEST_F(ServerConfigTest, DefaultsIdAndHostLabel) {
  auto servers = parse_server_config(R"(
servers:
  - openai_model: "meta-llama-3.1-8b-instruct"
    openai_api_base: "http://127.0.0.1:1234/v1"
)");

  ASSERT_EQ(servers.size(), 1);

  // id falls back to the model, host label to the url host
  EXPECT_EQ(servers[0].id, "meta-llama-3.1-8b-instruct");
  EXPECT_EQ(servers[0].host_label, "127.0.0.1");
  EXPECT_TRUE(servers[0].api_key_ref.empty());
}

TEST_F(ServerConfigTest, ReadsMaxTokens) {
  auto servers = parse_server_config(R"(
servers:
  - openai_model: "m"
    openai_api_base: "http://h/v1"
    max_tokens: 32
)");

  ASSERT_TRUE(servers[0].max_tokens.has_value());
  EXPECT_EQ(*servers[0].max_tokens, 32u);
}

TEST_F(ServerConfigTest, RejectsMalformedDocuments) {
  EXPECT_THROW(parse_server_config("servers: [unterminated"), ConfigError);
  EXPECT_THROW(parse_server_config("other: 1"), ConfigError);
  EXPECT_THROW(parse_server_config("servers: 5"), ConfigError);
  EXPECT_THROW(parse_server_config("servers: []"), ConfigError);
  EXPECT_THROW(parse_server_config("servers:\n  - just-a-string\n"), ConfigError);
}

TEST_F(ServerConfigTest, RejectsMissingRequiredFields) {
  EXPECT_THROW(parse_server_config("servers:\n  - openai_api_base: \"http://h/v1\"\n"), ConfigError);
  EXPECT_THROW(parse_server_config("servers:\n  - openai_model: \"m\"\n"), ConfigError);
  EXPECT_THROW(parse_server_config("servers:\n  - openai_model: \"\"\n    openai_api_base: \"http://h/v1\"\n"), ConfigError);
  EXPECT_THROW(parse_server_config("servers:\n  - openai_model: [a, b]\n    openai_api_base: \"http://h/v1\"\n"), ConfigError);
}

TEST_F(ServerConfigTest, RejectsBadUrls) {
  EXPECT_THROW(parse_server_config("servers:\n  - openai_model: m\n    openai_api_base: \"not a url\"\n"), ConfigError);
  EXPECT_THROW(parse_server_config("servers:\n  - openai_model: m\n    openai_api_base: \"ftp://h/v1\"\n"), ConfigError);
}

TEST_F(ServerConfigTest, RejectsBadMaxTokens) {
  EXPECT_THROW(parse_server_config("servers:\n  - openai_model: m\n    openai_api_base: \"http://h\"\n    max_tokens: 0\n"), ConfigError);
  EXPECT_THROW(parse_server_config("servers:\n  - openai_model: m\n    openai_api_base: \"http://h\"\n    max_tokens: lots\n"), ConfigError);
}

TEST_F(ServerConfigTest, RejectsDuplicateIds) {
  EXPECT_THROW(parse_server_config(R"(
servers:
  - shortname: a
    openai_model: m1
    openai_api_base: "http://h1/v1"
  - shortname: a
    openai_model: m2
    openai_api_base: "http://h2/v1"
)"),
               ConfigError);
}

TEST_F(ServerConfigTest, MissingFileIsConfigError) {
  EXPECT_THROW(load_server_config("/nonexistent/model_servers.yaml"), ConfigError);
}

TEST_F(ServerConfigTest, FilterSkipsOpenAiHosts) {
  auto servers = two_servers();

  auto kept = filter_servers(servers, ServerFilter{ {}, true });

  ASSERT_EQ(kept.size(), 1);
  EXPECT_EQ(kept[0].id, "scout");
}

TEST_F(ServerConfigTest, FilterKeepsOnlyNamedIds) {
  auto servers = two_servers();

  auto kept = filter_servers(servers, ServerFilter{ { "gpt41" }, false });

  ASSERT_EQ(kept.size(), 1);
  EXPECT_EQ(kept[0].id, "gpt41");
}

TEST_F(ServerConfigTest, FilterErrors) {
  auto servers = two_servers();

  // unknown id
  EXPECT_THROW(filter_servers(servers, ServerFilter{ { "nope" }, false }), ConfigError);

  // nothing left
  EXPECT_THROW(filter_servers(servers, ServerFilter{ { "gpt41" }, true }), ConfigError);
}
