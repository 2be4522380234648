#include "lucid_cli/cli_handler.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace lucid_cli {

namespace {

// Collects "--flag value" pairs after the command word.
std::string flag_value(int argc, char* argv[], const std::string& long_flag,
                       const std::string& short_flag) {
    for (int i = 2; i + 1 < argc; i += 2) {
        std::string flag = argv[i];
        if (flag == long_flag || flag == short_flag) {
            return argv[i + 1];
        }
    }
    return "";
}

struct SlistDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    while (!api_base_url_.empty() && api_base_url_.back() == '/') {
        api_base_url_.pop_back();
    }
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_)), curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "query" || command == "q") {
        options.command = Command::Query;
        options.query = flag_value(argc, argv, "--query", "-q");
        if (options.query.empty()) {
            throw CliError("Query command requires a question. Usage: query --query <text>");
        }
        std::string top_k = flag_value(argc, argv, "--top-k", "-k");
        std::string threshold = flag_value(argc, argv, "--threshold", "-t");
        try {
            if (!top_k.empty()) {
                options.top_k = std::stoi(top_k);
            }
            if (!threshold.empty()) {
                options.threshold = std::stod(threshold);
            }
        } catch (const std::logic_error&) {
            throw CliError("--top-k must be an integer and --threshold a number");
        }
    } else if (command == "index" || command == "i") {
        options.command = Command::Index;
        options.document_id = flag_value(argc, argv, "--id", "-i");
        options.file_path = flag_value(argc, argv, "--file", "-f");
        if (options.document_id.empty() || options.file_path.empty()) {
            throw CliError("Index command requires a document id and a file. "
                           "Usage: index --id <doc> --file <path>");
        }
    } else if (command == "delete" || command == "d") {
        options.command = Command::Delete;
        options.document_id = flag_value(argc, argv, "--id", "-i");
        if (options.document_id.empty()) {
            throw CliError("Delete command requires a document id. Usage: delete --id <doc>");
        }
    } else if (command == "chunks" || command == "c") {
        options.command = Command::Chunks;
        options.document_id = flag_value(argc, argv, "--id", "-i");
        if (options.document_id.empty()) {
            throw CliError("Chunks command requires a document id. Usage: chunks --id <doc>");
        }
    } else if (command == "health") {
        options.command = Command::Health;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Query:
            handle_query_command(options);
            break;
        case Command::Index:
            handle_index_command(options);
            break;
        case Command::Delete:
            handle_delete_command(options);
            break;
        case Command::Chunks:
            handle_chunks_command(options);
            break;
        case Command::Health:
            handle_health_command();
            break;
        case Command::Help:
            print_help();
            break;
    }
}

nlohmann::json CliHandler::build_query_body(const CliOptions& options) {
    nlohmann::json body = {{"query", options.query}};
    if (options.top_k) {
        body["top_k"] = *options.top_k;
    }
    if (options.threshold) {
        body["threshold"] = *options.threshold;
    }
    return body;
}

std::string CliHandler::read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CliError("Failed to open file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void CliHandler::handle_query_command(const CliOptions& options) {
    std::cout << "Query: " << options.query << std::endl;
    nlohmann::json response = make_request("POST", "/query", build_query_body(options));
    print_query_response(response);
}

void CliHandler::handle_index_command(const CliOptions& options) {
    std::cout << "Indexing " << options.file_path << " as document " << options.document_id
              << std::endl;
    nlohmann::json body = {{"content", read_file(options.file_path)}};
    nlohmann::json response = make_request("PUT", "/documents/" + options.document_id, body);
    std::cout << "Stored " << response.value("chunks", 0) << " chunks." << std::endl;
}

void CliHandler::handle_delete_command(const CliOptions& options) {
    make_request("DELETE", "/documents/" + options.document_id);
    std::cout << "Deleted chunks of document " << options.document_id << "." << std::endl;
}

void CliHandler::handle_chunks_command(const CliOptions& options) {
    nlohmann::json response = make_request("GET", "/documents/" + options.document_id + "/chunks");
    print_chunks_response(response);
}

void CliHandler::handle_health_command() {
    std::cout << make_request("GET", "/").dump(2) << std::endl;
}

nlohmann::json CliHandler::make_request(const std::string& method,
                                        const std::string& endpoint,
                                        const std::optional<nlohmann::json>& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string request_json = data ? data->dump() : "";
    std::string response_buffer;
    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
    if (data) {
        curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_json.size()));
    }

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code != 200) {
        std::string message = "HTTP request failed with status code: " + std::to_string(http_code);
        if (!body.is_discarded() && body.is_object() && body.contains("error") &&
            body["error"].is_string()) {
            message += " (" + body["error"].get<std::string>() + ")";
        }
        throw CliError(message);
    }
    if (body.is_discarded()) {
        throw CliError("Invalid JSON in response from " + url);
    }
    return body;
}

void CliHandler::print_query_response(const nlohmann::json& response) {
    std::cout << "\n" << std::string(80, '=') << std::endl;
    std::cout << response.value("answer", "") << std::endl;
    std::cout << std::string(80, '=') << std::endl;
    std::cout << "Confidence: " << std::fixed << std::setprecision(2)
              << response.value("confidence_score", 0.0) << " | Time: "
              << response.value("processing_time_ms", 0) << " ms" << std::endl;

    if (response.contains("relevant_chunks") && response["relevant_chunks"].is_array() &&
        !response["relevant_chunks"].empty()) {
        std::cout << "\nSources:" << std::endl;
        int source = 1;
        for (const auto& chunk : response["relevant_chunks"]) {
            std::string content = chunk.value("content", "");
            std::cout << "  [" << source++ << "] " << chunk.value("document_id", "") << ":"
                      << chunk.value("chunk_index", 0) << "  " << content.substr(0, 100);
            if (content.length() > 100) {
                std::cout << "...";
            }
            std::cout << std::endl;
        }
    }
}

void CliHandler::print_chunks_response(const nlohmann::json& response) {
    if (!response.contains("chunks") || !response["chunks"].is_array() ||
        response["chunks"].empty()) {
        std::cout << "No chunks found." << std::endl;
        return;
    }
    for (const auto& chunk : response["chunks"]) {
        std::cout << "#" << chunk.value("chunk_index", 0) << " (" << chunk.value("id", "") << ", "
                  << chunk.value("created_at", "") << ")" << std::endl;
        std::cout << "  " << chunk.value("content", "") << std::endl << std::endl;
    }
}

void CliHandler::print_help() {
    std::cout << R"(
Lucid CLI - Retrieval-augmented question answering

Usage: lucid <command> [options]

Commands:
  query, q      Ask a question against the indexed documents
    --query, -q <text>      Question text
    --top-k, -k <num>       Chunks to retrieve (server default when omitted)
    --threshold, -t <num>   Minimum similarity in (0, 1]

  index, i      Index (or re-index) a document from a file
    --id, -i <doc>          Document id
    --file, -f <path>       File holding the document text

  delete, d     Remove the chunks of a document
    --id, -i <doc>          Document id

  chunks, c     List the stored chunks of a document
    --id, -i <doc>          Document id

  health        Show server status
  help, h       Show this help message

Environment Variables:
  LUCID_API_URL  Base URL of the Lucid API (default: http://127.0.0.1:3030)

Examples:
  lucid index --id handbook --file ./handbook.txt
  lucid query --query "What is the refund policy?" --top-k 3
  lucid chunks --id handbook
  lucid delete --id handbook
)" << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    return api_base_url_ + endpoint;
}

}  // namespace lucid_cli
