#include "mdquery_cli/cli_handler.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "mdquery/index/file_system_indexer.hpp"
#include "mdquery/index/sqlite_index_backend.hpp"
#include "mdquery/query/metadata_query.hpp"

namespace mdquery_cli {

using namespace mdquery;

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) {
            comma = value.size();
        }
        std::string part = value.substr(start, comma - start);
        if (!part.empty()) {
            parts.push_back(part);
        }
        start = comma + 1;
    }
    return parts;
}

std::string require_value(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw CliError("Missing value for " + flag);
    }
    return argv[++i];
}

void print_groups(const std::vector<ResultGroup>& groups, int depth) {
    const auto& catalog = AttributeCatalog::get_instance();
    for (const auto& group : groups) {
        std::cout << std::string(depth * 2, ' ') << catalog.name(group.attribute) << " = "
                  << (is_null(group.value) ? "(none)" : to_display_string(group.value)) << " ("
                  << group.items.size() << ")" << std::endl;
        if (group.subgroups.empty()) {
            for (const auto& item : group.items) {
                std::cout << std::string(depth * 2 + 2, ' ') << item->path().value_or("?")
                          << std::endl;
            }
        } else {
            print_groups(group.subgroups, depth + 1);
        }
    }
}

void print_folder(const HierarchyFolder& folder, int depth) {
    const std::string indent(depth * 2, ' ');
    for (const auto& file : folder.files) {
        std::cout << indent << (file.name.empty() ? "(no path)" : file.name) << std::endl;
    }
    for (const auto& subfolder : folder.subfolders) {
        std::cout << indent << subfolder->name << "/" << std::endl;
        print_folder(*subfolder, depth + 1);
    }
}

}  // namespace

CliHandler::CliHandler(const std::string& default_db_path) : default_db_path_(default_db_path) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "index" || command == "i") {
        options.command = Command::Index;
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];

        if (flag == "--db" || flag == "-d") {
            options.db_path = require_value(argc, argv, i, flag);
        } else if (flag == "--config" || flag == "-c") {
            options.config_path = require_value(argc, argv, i, flag);
        } else if (flag == "--verbose" || flag == "-v") {
            options.verbose = true;
        } else if (options.command == Command::Index && (flag == "--root" || flag == "-r")) {
            options.root = require_value(argc, argv, i, flag);
        } else if (options.command == Command::Index && flag == "--hidden") {
            options.include_hidden = true;
        } else if (options.command == Command::Search && (flag == "--name" || flag == "-n")) {
            options.name = require_value(argc, argv, i, flag);
        } else if (options.command == Command::Search && (flag == "--ext" || flag == "-e")) {
            options.extensions = split_list(require_value(argc, argv, i, flag));
        } else if (options.command == Command::Search && (flag == "--type" || flag == "-t")) {
            options.type = require_value(argc, argv, i, flag);
        } else if (options.command == Command::Search && flag == "--min-size") {
            options.min_size = require_value(argc, argv, i, flag);
        } else if (options.command == Command::Search && flag == "--max-size") {
            options.max_size = require_value(argc, argv, i, flag);
        } else if (options.command == Command::Search && (flag == "--modified" || flag == "-m")) {
            options.modified = require_value(argc, argv, i, flag);
        } else if (options.command == Command::Search && flag == "--tag") {
            options.tag = require_value(argc, argv, i, flag);
        } else if (options.command == Command::Search && flag == "--sort") {
            options.sort = require_value(argc, argv, i, flag);
        } else if (options.command == Command::Search && flag == "--group") {
            options.group = require_value(argc, argv, i, flag);
        } else if (options.command == Command::Search && flag == "--tree") {
            options.tree = true;
        } else if (options.command == Command::Search && flag == "--json") {
            options.json = true;
        } else {
            throw CliError("Unknown option for " + command + ": " + flag);
        }
    }

    if (options.command == Command::Index && options.root.empty()) {
        throw CliError("Index command requires a directory. Usage: index --root <dir>");
    }
    if (options.tree && options.json) {
        throw CliError("--tree and --json cannot be combined");
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Index:
            handle_index_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Help:
            handle_help_command(options);
            break;
    }
}

std::string CliHandler::resolve_db_path(const CliOptions& options) const {
    if (!options.db_path.empty()) {
        return options.db_path;
    }
    if (default_db_path_.empty()) {
        throw CliError("No index database given. Use --db <file> or set MDQUERY_DB");
    }
    return default_db_path_;
}

QueryOptions CliHandler::load_query_options(const CliOptions& options) const {
    QueryOptions query_options;
    if (!options.config_path.empty()) {
        query_options = QueryOptions::from_file(options.config_path);
    }
    if (options.verbose) {
        query_options.debug = true;
    }
    // A one-shot search has nothing to monitor.
    query_options.monitor_results = false;
    return query_options;
}

void CliHandler::handle_index_command(const CliOptions& options) {
    const std::string db_path = resolve_db_path(options);
    std::cout << "Indexing " << options.root << " into " << db_path << std::endl;

    try {
        SqliteIndexBackend backend(db_path, options.verbose);
        FileSystemIndexer indexer(backend, options.verbose);
        IndexStats stats = indexer.index_directory(options.root, options.include_hidden);

        std::cout << "Indexed " << stats.files_indexed << " files and " << stats.folders_indexed
                  << " folders";
        if (stats.errors > 0) {
            std::cout << " (" << stats.errors << " errors)";
        }
        std::cout << std::endl;
    } catch (const IndexBackendError& e) {
        print_error("Failed to index: " + std::string(e.what()));
        throw CliError("Indexing " + options.root + " failed");
    }
}

void CliHandler::handle_search_command(const CliOptions& options) {
    const std::string db_path = resolve_db_path(options);
    QueryOptions query_options = load_query_options(options);
    std::unique_ptr<SqliteIndexBackend> backend_ptr;
    try {
        backend_ptr = std::make_unique<SqliteIndexBackend>(db_path, options.verbose);
    } catch (const IndexBackendError& e) {
        print_error("Failed to open index: " + std::string(e.what()));
        throw CliError("Cannot search " + db_path);
    }
    SqliteIndexBackend& backend = *backend_ptr;

    MetadataQuery query(backend, query_options);
    query.set_predicate(build_predicate(options));
    query.set_attributes({AttributeId::FileName, AttributeId::FileSize,
                          AttributeId::ModificationDate, AttributeId::ContentType,
                          AttributeId::FinderTags});
    if (!options.sort.empty()) {
        std::vector<SortDescriptor> sort;
        for (const auto& key : split_list(options.sort)) {
            sort.push_back(parse_sort(key));
        }
        query.set_sort(sort);
    }
    if (!options.group.empty()) {
        std::vector<AttributeId> grouping;
        for (const auto& name : split_list(options.group)) {
            auto attribute = AttributeCatalog::get_instance().from_name(name);
            if (!attribute) {
                throw CliError("Unknown attribute: " + name);
            }
            grouping.push_back(*attribute);
        }
        query.set_grouping(grouping);
    }

    if (options.verbose) {
        std::cout << "Query: " << query.predicate_format() << std::endl;
    }

    // The index backend gathers synchronously.
    query.start();
    std::vector<MetadataItemPtr> items = query.results();

    if (options.json) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : items) {
            out.push_back(item_to_json(*item));
        }
        std::cout << out.dump(2) << std::endl;
    } else if (options.tree) {
        HierarchicalResults tree = build_hierarchy(items);
        std::cout << tree.top_level_path() << std::endl;
        print_folder(tree.root(), 1);
    } else if (!options.group.empty()) {
        print_groups(query.grouped_results(), 0);
    } else {
        for (const auto& item : items) {
            print_item(*item);
        }
    }

    if (!options.json) {
        std::cout << items.size() << " result" << (items.size() == 1 ? "" : "s") << std::endl;
    }
    query.stop();
}

void CliHandler::handle_help_command(const CliOptions& /*options*/) {
    print_help();
}

Predicate CliHandler::build_predicate(const CliOptions& options) {
    PredicateRoot item;
    std::vector<Predicate> parts;

    if (!options.name.empty()) {
        parts.push_back(item.file_name().contains(options.name));
    }
    if (!options.extensions.empty()) {
        parts.push_back(item.file_extension().equals_any(options.extensions));
    }
    if (!options.type.empty()) {
        auto type = file_type_from_string(lower(options.type));
        if (!type) {
            throw CliError("Unknown file type: " + options.type);
        }
        parts.push_back(item.file_type().equals(*type));
    }
    if (!options.min_size.empty()) {
        parts.push_back(
            item.file_size().greater_or_equal(static_cast<double>(parse_size(options.min_size))));
    }
    if (!options.max_size.empty()) {
        parts.push_back(
            item.file_size().less_or_equal(static_cast<double>(parse_size(options.max_size))));
    }
    if (!options.modified.empty()) {
        parts.push_back(item.modification_date().is(parse_date_bucket(options.modified)));
    }
    if (!options.tag.empty()) {
        parts.push_back(item.finder_tags().contains(options.tag));
    }

    return all_of(parts);
}

std::int64_t CliHandler::parse_size(const std::string& text) {
    static const std::vector<std::pair<std::string, SizeUnit>> suffixes = {
        {"pb", SizeUnit::Petabytes}, {"tb", SizeUnit::Terabytes}, {"gb", SizeUnit::Gigabytes},
        {"mb", SizeUnit::Megabytes}, {"kb", SizeUnit::Kilobytes}, {"b", SizeUnit::Bytes},
    };

    std::string value = lower(text);
    SizeUnit unit = SizeUnit::Bytes;
    for (const auto& [suffix, suffix_unit] : suffixes) {
        if (value.size() > suffix.size() &&
            value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0) {
            unit = suffix_unit;
            value.erase(value.size() - suffix.size());
            break;
        }
    }

    double amount = 0;
    try {
        size_t consumed = 0;
        amount = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw CliError("Invalid size: " + text);
        }
    } catch (const std::logic_error&) {
        throw CliError("Invalid size: " + text);
    }
    if (amount < 0) {
        throw CliError("Size cannot be negative: " + text);
    }
    return static_cast<std::int64_t>(std::llround(amount * static_cast<double>(bytes_per_unit(unit))));
}

DateValue CliHandler::parse_date_bucket(const std::string& text) {
    const std::string value = lower(text);
    if (value == "now") return DateValue::now();
    if (value == "this-hour") return DateValue::this_hour();
    if (value == "last-hour") return DateValue::last_hour();
    if (value == "today") return DateValue::today();
    if (value == "yesterday") return DateValue::yesterday();
    if (value == "this-week") return DateValue::this_week();
    if (value == "last-week") return DateValue::last_week();
    if (value == "this-month") return DateValue::this_month();
    if (value == "last-month") return DateValue::last_month();
    if (value == "this-year") return DateValue::this_year();
    if (value == "last-year") return DateValue::last_year();

    // <n><unit>: within the last n units, e.g. "3d", "2w".
    if (value.size() >= 2 && std::isdigit(static_cast<unsigned char>(value.front()))) {
        const char suffix = value.back();
        DateUnit unit;
        switch (suffix) {
            case 'h': unit = DateUnit::Hour; break;
            case 'd': unit = DateUnit::Day; break;
            case 'w': unit = DateUnit::Week; break;
            case 'm': unit = DateUnit::Month; break;
            case 'y': unit = DateUnit::Year; break;
            default: throw CliError("Unknown date unit in: " + text);
        }
        const std::string digits = value.substr(0, value.size() - 1);
        if (!std::all_of(digits.begin(), digits.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw CliError("Invalid date range: " + text);
        }
        try {
            return DateValue::within(std::stoi(digits), unit);
        } catch (const std::logic_error&) {
            throw CliError("Invalid date range: " + text);
        }
    }

    throw CliError("Unknown date value: " + text);
}

SortDescriptor CliHandler::parse_sort(const std::string& text) {
    bool descending = !text.empty() && text.front() == '-';
    const std::string name = descending ? text.substr(1) : text;
    auto attribute = AttributeCatalog::get_instance().from_name(name);
    if (!attribute) {
        throw CliError("Unknown sort attribute: " + name);
    }
    try {
        return descending ? SortDescriptor::descending(*attribute)
                          : SortDescriptor::ascending(*attribute);
    } catch (const QueryConfigError& e) {
        throw CliError(e.what());
    }
}

nlohmann::json CliHandler::item_to_json(const MetadataItem& item) {
    nlohmann::json out;
    out["id"] = item.id();
    out["path"] = item.path() ? nlohmann::json(*item.path()) : nlohmann::json(nullptr);
    out["values"] = attribute_values_to_json(item.values());
    return out;
}

void CliHandler::print_item(const MetadataItem& item) {
    std::cout << item.path().value_or("(no path)");
    if (auto size = item.file_size()) {
        std::cout << "  " << *size << " bytes";
    }
    if (auto modified = item.modification_date()) {
        std::cout << "  " << format_iso8601(*modified);
    }
    std::cout << std::endl;
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << "mdquery - typed metadata search over a local index\n\n"
              << "Usage:\n"
              << "  mdquery_cli index --root <dir> [--db <file>] [--hidden] [--verbose]\n"
              << "  mdquery_cli search [--db <file>] [options]\n"
              << "  mdquery_cli help\n\n"
              << "Search options:\n"
              << "  --name <text>        file name contains text (case insensitive)\n"
              << "  --ext <a,b,...>      file extension is one of the list\n"
              << "  --type <type>        image, video, audio, pdf, text, folder, ...\n"
              << "  --min-size <size>    e.g. 10MB (decimal units)\n"
              << "  --max-size <size>    e.g. 1GB\n"
              << "  --modified <when>    today, yesterday, this-week, last-month, 7d, ...\n"
              << "  --tag <tag>          has the tag\n"
              << "  --sort [-]<attr>     sort by attribute, '-' for descending\n"
              << "  --group <attr,...>   group results by attributes\n"
              << "  --tree               print results as a folder tree\n"
              << "  --json               print results as JSON\n"
              << "  --config <file>      query options (JSON)\n\n"
              << "The database defaults to $MDQUERY_DB." << std::endl;
}

}  // namespace mdquery_cli
