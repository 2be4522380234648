#pragma once

#include <curl/curl.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace lucid_cli
{

  enum class Command
  {
    Query,
    Index,
    Delete,
    Chunks,
    Health,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string query;
    std::optional<int> top_k;
    std::optional<double> threshold;
    std::string document_id;
    std::string file_path;
  };

  class CliError : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  class CliHandler
  {
  public:
    static constexpr const char *DEFAULT_API_URL = "http://127.0.0.1:3030";

    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Throws CliError on unknown commands or missing required flags.
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Throws CliError when the request fails or the API answers non-200.
    void execute_command(const CliOptions &options);

    const std::string &get_api_base_url() const
    {
      return api_base_url_;
    }

    // Request bodies, exposed for tests.
    static nlohmann::json build_query_body(const CliOptions &options);
    static std::string read_file(const std::string &path);

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    void handle_query_command(const CliOptions &options);
    void handle_index_command(const CliOptions &options);
    void handle_delete_command(const CliOptions &options);
    void handle_chunks_command(const CliOptions &options);
    void handle_health_command();

    nlohmann::json make_request(const std::string &method,
                                const std::string &endpoint,
                                const std::optional<nlohmann::json> &data = std::nullopt);

    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_query_response(const nlohmann::json &response);
    void print_chunks_response(const nlohmann::json &response);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}  // namespace lucid_cli
