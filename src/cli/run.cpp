#include "densejson/cli/run.hpp"

#include "densejson/core/accessor.hpp"
#include "densejson/core/document.hpp"
#include "densejson/core/field_filter.hpp"
#include "densejson/core/layout.hpp"

#include <cstdlib>
#include <optional>
#include <ostream>
#include <utility>

namespace densejson::cli {

namespace {

void print_usage(std::ostream& stream, const std::string& program) {
    stream << "Usage:\n"
           << program << " <input.json> [path] [--config <options.json>] [--fields <term,term,...>]\n"
           << "    Print <input.json>, or the value at <path> inside it, as dense JSON.\n"
           << "    <path> is slash-delimited, e.g. data/0/name.\n"
           << "    --config reads render options, e.g. {\"indent\": 2}.\n"
           << "    --fields keeps only the members whose key contains one of the terms\n"
           << "    in each mapping of the selected list.\n";
}

std::vector<std::string> split_terms(const std::string& list) {
    std::vector<std::string> terms;
    std::size_t start = 0;
    while (start <= list.size()) {
        const std::size_t comma = list.find(',', start);
        const std::size_t end = comma == std::string::npos ? list.size() : comma;
        if (end > start) {
            terms.push_back(list.substr(start, end - start));
        }
        start = end + 1;
    }
    return terms;
}

} // namespace

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    const std::string program = args.empty() ? "densejson" : args.front();

    std::vector<std::string> positional;
    std::optional<std::string> config_path;
    std::optional<std::string> fields;
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--help" || args[i] == "-h") {
            print_usage(out, program);
            return EXIT_SUCCESS;
        }
        if (args[i] == "--config" || args[i] == "--fields") {
            if (i + 1 >= args.size()) {
                err << "missing value for " << args[i] << "\n";
                print_usage(err, program);
                return kUsageError;
            }
            (args[i] == "--config" ? config_path : fields) = args[i + 1];
            ++i;
            continue;
        }
        positional.push_back(args[i]);
    }
    if (positional.empty() || positional.size() > 2) {
        print_usage(err, program);
        return kUsageError;
    }

    core::RenderOptions options{};
    if (config_path.has_value()) {
        auto config_doc = core::Document::from_file(*config_path);
        if (!config_doc.has_value()) {
            err << *config_path << ": " << config_doc.error().message << " (offset " << config_doc.error().offset
                << ")" << std::endl;
            return EXIT_FAILURE;
        }
        auto parsed = core::parse_render_options(*config_doc);
        if (!parsed.has_value()) {
            err << *config_path << ": " << parsed.error().message << std::endl;
            return EXIT_FAILURE;
        }
        options = parsed.value();
    }

    auto document = core::Document::from_file(positional[0]);
    if (!document.has_value()) {
        err << positional[0] << ": " << document.error().message << " (offset " << document.error().offset << ")"
            << std::endl;
        return EXIT_FAILURE;
    }

    core::Value selected = document->root();
    if (positional.size() > 1) {
        auto accessor = core::Accessor::create(document->root());
        if (!accessor.has_value()) {
            err << accessor.error().message << std::endl;
            return EXIT_FAILURE;
        }
        auto resolved = accessor->resolve(positional[1]);
        if (!resolved.has_value()) {
            err << resolved.error().message << std::endl;
            return EXIT_FAILURE;
        }
        selected = std::move(resolved.value());
    }

    if (fields.has_value()) {
        const auto terms = split_terms(*fields);
        auto filtered = core::select_fields_like(selected, terms);
        if (!filtered.has_value()) {
            err << filtered.error().message << std::endl;
            return EXIT_FAILURE;
        }
        selected = std::move(filtered.value());
    }

    auto text = core::render(selected, options);
    if (!text.has_value()) {
        err << text.error().message << std::endl;
        return EXIT_FAILURE;
    }
    out << text.value() << std::endl;
    return EXIT_SUCCESS;
}

} // namespace densejson::cli
