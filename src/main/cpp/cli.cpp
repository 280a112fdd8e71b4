#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "parley/util/ansi.hpp"
#include "parley/util/assert.hpp"
#include "parley/util/io.hpp"
#include "parley/util/result.hpp"
#include "parley/util/strings.hpp"

#include "parley/delta.hpp"
#include "parley/diagnostic.hpp"
#include "parley/document.hpp"
#include "parley/edit.hpp"
#include "parley/fwd.hpp"
#include "parley/persistence.hpp"
#include "parley/print.hpp"
#include "parley/report.hpp"
#include "parley/schema.hpp"
#include "parley/serialize.hpp"
#include "parley/services.hpp"
#include "parley/validation.hpp"

namespace parley {
namespace {

struct Stderr_Logger final : Logger {
    const std::u8string_view main_file_name;
    const std::u8string_view main_file_source;
    const bool colors;
    std::u8string out;
    bool any_errors = false;

    [[nodiscard]]
    Stderr_Logger(
        Severity min_severity,
        std::u8string_view main_file_name,
        std::u8string_view main_file_source,
        bool colors
    )
        : Logger { min_severity }
        , main_file_name { main_file_name }
        , main_file_source { main_file_source }
        , colors { colors }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        any_errors |= diagnostic.severity >= Severity::error;
        // Diagnostics with a location but no file refer to the input document.
        if (diagnostic.file.empty() && !diagnostic.location.empty()) {
            diagnostic.file = main_file_name;
        }
        print_diagnostic(out, diagnostic, main_file_source, colors);
        print_stderr(out);
        out.clear();
    }
};

void print_issue(std::u8string& out, const Validation_Issue& issue, bool colors)
{
    const std::u8string_view highlight = issue.severity == Issue_Severity::critical ? ansi::h_red
        : issue.severity == Issue_Severity::warning                                 ? ansi::h_yellow
                                                                                    : ansi::blue;
    if (colors) {
        out += highlight;
    }
    out += issue_severity_name(issue.severity);
    if (colors) {
        out += ansi::reset;
    }
    out += u8' ';
    out += issue_code_name(issue.code);
    out += u8" in ";
    out += issue.tag_id.empty() ? issue.passage_id : issue.tag_id;
    out += u8": ";
    out += issue.message;
    out += u8'\n';
}

void print_report(std::u8string& out, const Validation_Report& report, bool colors)
{
    for (const Skipped_Schema& skipped : report.skipped) {
        out += u8"Skipped schema \"";
        out += skipped.schema_id;
        out += u8"\": ";
        out += skipped.message;
        out += u8'\n';
    }
    if (report.passed()) {
        out += u8"Document passes schema \"";
        out += *report.passed_schema_id;
        out += u8"\".\n";
    }
    else {
        out += u8"Document passes no schema; issues of \"";
        out += report.reported_schema_id;
        out += u8"\" follow.\n";
    }
    for (const auto* const list : { &report.errors, &report.warnings, &report.infos }) {
        for (const Validation_Issue& issue : *list) {
            print_issue(out, issue, colors);
        }
    }
    const Validation_Summary summary = report.summary();
    out += u8"critical: ";
    append_integer(out, summary.critical);
    out += u8", warnings: ";
    append_integer(out, summary.warnings);
    out += u8", info: ";
    append_integer(out, summary.infos);
    out += u8", health: ";
    append_integer(out, summary.health_score);
    out += u8'\n';
}

/// @brief Loads the history at `path` and applies its deltas up to the stored cursor
/// to the entities of `document`.
[[nodiscard]]
bool replay_history_file(Document& document, std::u8string_view path, Logger& logger, bool colors)
{
    const Result<std::u8string, IO_Error_Code> text = load_utf8_file(path);
    if (!text) {
        std::u8string error;
        print_io_error(error, path, text.error(), colors);
        print_stderr(error);
        return false;
    }
    const Result<Stored_History, Persistence_Error> history = load_history(*text);
    if (!history) {
        std::u8string message { path };
        message += u8": ";
        message += persistence_error_code_name(history.error().code);
        message += u8": ";
        message += history.error().message;
        logger.log(Severity::error, diagnostic::history_load, message);
        return false;
    }
    for (std::size_t i = 0; i < history->position; ++i) {
        Result<Document, Validation_Error> next = apply_entity_delta(document, history->deltas[i]);
        if (!next) {
            std::u8string message = u8"Delta ";
            append_integer(message, i);
            message += u8" of ";
            message += path;
            message += u8" was rejected (";
            message += validation_error_code_name(next.error().code);
            message += u8"): ";
            message += next.error().message;
            logger.log(Severity::error, diagnostic::history_replay, message);
            return false;
        }
        document = std::move(*next);
    }
    if (logger.can_log(Severity::info)) {
        std::u8string message = u8"Replayed ";
        append_integer(message, history->position);
        message += u8" of ";
        append_integer(message, history->deltas.size());
        message += u8" deltas from ";
        message += path;
        message += u8'.';
        logger.log(Severity::info, diagnostic::history_replay, message);
    }
    return true;
}

int main(int argc, const char* const* const argv)
{
    static const std::unordered_map<std::string, Severity> severity_arg_map {
        { "min", Severity::min },
        { "trace", Severity::trace },
        { "debug", Severity::debug },
        { "info", Severity::info },
        { "soft_warning", Severity::soft_warning },
        { "warning", Severity::warning },
        { "error", Severity::error },
        { "fatal", Severity::fatal },
        { "none", Severity::none },
    };

    args::ArgumentParser parser {
        "Validates annotated TEI documents against a ladder of schemas, "
        "replays entity histories, and writes the resulting markup."
    };
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;
    args::Positional<std::string> input_arg {
        parser,
        "input",
        "Input TEI document",
        args::Options::Required,
    };
    args::ValueFlag<std::string> output_arg {
        parser,
        "output",
        "Write the serialized document to this file",
        { 'o', "output" },
    };
    args::ValueFlag<std::string> schema_dir_arg {
        parser, "schema-dir", "Directory containing the <id>.rng grammars", { 's', "schema-dir" },
        "schemas",
    };
    args::ValueFlagList<std::string> schema_arg {
        parser,
        "id",
        "Restrict progressive fallback to these schemas",
        { "schema" },
    };
    args::ValueFlag<std::string> history_arg {
        parser,
        "log.json",
        "Replay this entity history onto the document",
        { "history" },
    };
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for log messages",
        { 'l', "severity" },
        severity_arg_map,
        Severity::info,
    };
    args::HelpFlag help_arg {
        parser, "help", "Display this help menu", { 'h', "help" }, args::Options::Global
    };

    if (argc <= 1) {
        parser.Help(std::cout);
        return EXIT_FAILURE;
    }
    if (!parser.ParseCLI(argc, argv) || parser.GetError() != args::Error::None) {
        std::cerr << parser.GetErrorMsg() << '\n';
        return EXIT_FAILURE;
    }
    if (help_arg.Matched()) {
        parser.Help(std::cout);
        return EXIT_SUCCESS;
    }

    const bool colors = is_tty(stderr);
    const std::string in_path = input_arg.Get();
    const std::u8string_view in_path_u8 = as_u8string_view(in_path);

    const Result<std::u8string, IO_Error_Code> in_text = load_utf8_file(in_path_u8);
    if (!in_text) {
        std::u8string error;
        print_io_error(error, in_path_u8, in_text.error(), colors);
        print_stderr(error);
        return EXIT_FAILURE;
    }

    Stderr_Logger logger { severity_arg.Get(), in_path_u8, *in_text, colors };

    Result<Document, Parse_Error> loaded = load_document(*in_text, logger);
    if (!loaded) {
        // The parse error was already reported through the logger.
        return EXIT_FAILURE;
    }
    Document document = std::move(*loaded);

    if (history_arg) {
        const std::string history_path = history_arg.Get();
        if (!replay_history_file(document, as_u8string_view(history_path), logger, colors)) {
            return EXIT_FAILURE;
        }
    }

    const Schema_Catalog full_catalog
        = default_schema_catalog(as_u8string_view(schema_dir_arg.Get()));
    File_Schema_Source source;
    Lru_Constraint_Cache constraint_cache;

    Schema_Catalog catalog = full_catalog;
    if (schema_arg) {
        std::vector<std::u8string> ids;
        for (const std::string& id : schema_arg.Get()) {
            const std::u8string_view id_u8 = as_u8string_view(id);
            if (!full_catalog.contains(id_u8)) {
                // The resolver reports the unknown id, with a suggestion if one is close enough.
                Schema_Resolver probe { full_catalog, source, constraint_cache, logger };
                [[maybe_unused]] const auto probed = probe.resolve(id_u8);
                PARLEY_ASSERT(!probed);
                return EXIT_FAILURE;
            }
            ids.emplace_back(id_u8);
        }
        catalog = full_catalog.subset(ids);
    }

    Schema_Resolver resolver { catalog, source, constraint_cache, logger };
    Memory_Validation_Cache validation_cache;
    const Result<Validation_Report, Fallback_Error> report
        = validate_document(document, resolver, validation_cache);
    if (!report) {
        std::u8string out = report.error().message;
        out += u8'\n';
        print_stderr(out);
        return EXIT_FAILURE;
    }

    std::u8string report_text;
    print_report(report_text, *report, is_tty(stdout));
    print_stdout(report_text);

    if (output_arg) {
        const std::string out_path = output_arg.Get();
        const std::u8string_view out_path_u8 = as_u8string_view(out_path);
        const Result<void, IO_Error_Code> written
            = text_to_file(serialize_document(document), out_path_u8);
        if (!written) {
            std::u8string error;
            print_io_error(error, out_path_u8, written.error(), colors);
            print_stderr(error);
            return EXIT_FAILURE;
        }
    }

    return logger.any_errors || !report->passed() ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace
} // namespace parley

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, const char* const* argv)
{
    return parley::main(argc, argv);
}
