#include <prism_image/prism_image.hpp>

#include <loguru.hpp>

#include <charconv>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct step {
    std::string operation;  // Empty for "reset"
    prism_image::raw_params params;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <input> <output> [op [key=value...]] [then op ...] [reset]\n";
    std::cerr << "Applies a chain of operations and writes the result in the format\n";
    std::cerr << "named by the output extension (png, jpg, webp, bmp).\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -l, --list         List operations and codecs\n";
    std::cerr << "  -q, --quality N    JPEG/WEBP quality 0..100 (default 90)\n";
    std::cerr << "      --lossless     Write lossless WEBP\n";
    std::cerr << "  -v N               Log verbosity (1 traces every operation)\n";
    std::cerr << "  -h, --help         Show this help\n";
}

void list_catalog() {
    std::cout << "Operations:\n";
    for (const auto& op : prism_image::operations()) {
        std::cout << "  " << op.name << " - " << op.description << "\n";
        for (const auto& p : op.params) {
            std::cout << "      " << p.name;
            if (!p.alias.empty()) {
                std::cout << " (" << p.alias << ")";
            }
            std::cout << (p.type == prism_image::param_type::real ? " real" : " int");
            if (p.required) {
                std::cout << ", required";
            } else {
                std::cout << ", default " << p.default_value;
            }
            std::cout << ": " << p.description << "\n";
        }
    }

    std::cout << "\nCodecs:\n";
    const auto& registry = prism_image::codec_registry::builtin();
    for (std::size_t i = 0; i < registry.codec_count(); ++i) {
        const auto* c = registry.codec_at(i);
        std::cout << "  " << c->name() << " (";
        bool first = true;
        for (const auto& ext : c->extensions()) {
            if (!first) std::cout << ", ";
            std::cout << ext;
            first = false;
        }
        std::cout << ")\n";
    }
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

bool write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(file);
}

// Split "op k=v k=v then op k=v reset" into steps
bool parse_steps(const std::vector<std::string_view>& args, std::vector<step>& steps) {
    for (const auto arg : args) {
        if (arg == "then") {
            continue;
        }
        if (arg == "reset") {
            steps.push_back({});
            continue;
        }

        const auto eq = arg.find('=');
        if (eq == std::string_view::npos) {
            steps.push_back({std::string(arg), {}});
            continue;
        }

        if (steps.empty() || steps.back().operation.empty()) {
            std::cerr << "Error: Parameter without operation: " << arg << "\n";
            return false;
        }
        steps.back().params.insert_or_assign(std::string(arg.substr(0, eq)),
                                             std::string(arg.substr(eq + 1)));
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    loguru::g_stderr_verbosity = loguru::Verbosity_WARNING;
    loguru::init(argc, argv);

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    prism_image::encode_options encode_opts;
    std::vector<std::string_view> positional;

    // Check for options
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-l") == 0 || std::strcmp(argv[i], "--list") == 0) {
            list_catalog();
            return 0;
        }
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "-q") == 0 || std::strcmp(argv[i], "--quality") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argv[i] << " needs a value\n";
                return 1;
            }
            const std::string_view value(argv[++i]);
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), encode_opts.quality);
            if (ec != std::errc() || ptr != value.data() + value.size()) {
                std::cerr << "Error: Invalid quality: " << value << "\n";
                return 1;
            }
            continue;
        }
        if (std::strcmp(argv[i], "--lossless") == 0) {
            encode_opts.lossless = true;
            continue;
        }
        positional.emplace_back(argv[i]);
    }

    if (positional.size() < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path input_path(positional[0]);
    const std::filesystem::path output_path(positional[1]);

    const auto output_format = prism_image::parse_image_format(output_path.extension().string());
    if (!output_format) {
        std::cerr << "Error: Unknown output format: " << output_path << "\n";
        return 1;
    }

    std::vector<step> steps;
    const std::vector<std::string_view> chain(positional.begin() + 2, positional.end());
    if (!parse_steps(chain, steps)) {
        return 1;
    }

    // Reject a bad chain before touching the input file
    std::vector<prism_image::transform_request> requests(steps.size());
    for (std::size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].operation.empty()) {
            continue;
        }
        auto res = prism_image::validate(steps[i].operation, steps[i].params, requests[i]);
        if (!res) {
            std::cerr << "Error: " << res.message << " (" << prism_image::to_string(res.error) << ")\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    // Read input file
    auto data = read_file(input_path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << input_path << "\n";
        return 1;
    }

    const auto detected = prism_image::detect_format(data);
    if (detected) {
        std::cout << "Detected format: " << prism_image::to_string(*detected) << "\n";
    }

    // Decode image
    prism_image::pixel_grid original;
    auto res = prism_image::decode(data, original);
    if (!res) {
        std::cerr << "Error: Failed to decode: " << res.message << "\n";
        return 1;
    }

    std::cout << "Decoded: " << original.width() << "x" << original.height()
              << (original.has_alpha() ? " with alpha" : "") << "\n";

    // The original stays untouched; current holds the latest result
    prism_image::pixel_grid current = original.clone();
    for (std::size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].operation.empty()) {
            current = original.clone();
            std::cout << "Reset to original\n";
            continue;
        }

        prism_image::pixel_grid next;
        res = prism_image::apply(current, next, requests[i]);
        if (!res) {
            std::cerr << "Error: " << res.message << " (" << prism_image::to_string(res.error) << ")\n";
            return 1;
        }
        current = std::move(next);
        std::cout << "Applied " << steps[i].operation << ": "
                  << current.width() << "x" << current.height() << "\n";
    }

    std::vector<std::uint8_t> encoded;
    res = prism_image::encode(current, *output_format, encoded, encode_opts);
    if (!res) {
        std::cerr << "Error: Failed to encode: " << res.message << "\n";
        return 1;
    }

    if (!write_file(output_path, encoded)) {
        std::cerr << "Error: Failed to save: " << output_path << "\n";
        return 1;
    }

    std::cout << "Saved: " << output_path << "\n";

    return 0;
}
