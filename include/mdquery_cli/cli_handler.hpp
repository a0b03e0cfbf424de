#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "mdquery/predicate/fields.hpp"
#include "mdquery/query/metadata_item.hpp"
#include "mdquery/query/query_options.hpp"
#include "mdquery/query/sort_descriptor.hpp"

namespace mdquery_cli
{

  enum class Command
  {
    Index,
    Search,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string db_path;
    std::string config_path;
    bool verbose = false;

    // index
    std::string root;
    bool include_hidden = false;

    // search
    std::string name;
    std::vector<std::string> extensions;
    std::string type;
    std::string min_size;
    std::string max_size;
    std::string modified;
    std::string tag;
    std::string sort;
    std::string group;
    bool tree = false;
    bool json = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &default_db_path);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    // Search flags -> predicate. Throws CliError on malformed values.
    static mdquery::Predicate build_predicate(const CliOptions &options);

    // "10MB", "1.5GB", "512" (bytes). Decimal units.
    static std::int64_t parse_size(const std::string &text);

    // "today", "yesterday", "this-week", "last-month", "7d", ...
    static mdquery::DateValue parse_date_bucket(const std::string &text);

    // "file_size" ascending, "-file_size" descending.
    static mdquery::SortDescriptor parse_sort(const std::string &text);

    static nlohmann::json item_to_json(const mdquery::MetadataItem &item);

  private:
    std::string default_db_path_;

    // Command handlers
    void handle_index_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_help_command(const CliOptions &options);

    // Helper methods
    std::string resolve_db_path(const CliOptions &options) const;
    mdquery::QueryOptions load_query_options(const CliOptions &options) const;
    void print_item(const mdquery::MetadataItem &item);
    void print_error(const std::string &error);
    void print_help();
  };

}
