#include "circle_art.hpp"
#include "color.hpp"
#include "config.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <input_image> <output.svg> [options]\n"
              << "\n"
              << "Circle art generator: turns an image into print-ready SVG circles\n"
              << "\n"
              << "Options:\n"
              << "  -d, --diameter <px>       Circle diameter in pixels (default: 10)\n"
              << "  -s, --spacing <px>        Spacing between circles in pixels (default: 2)\n"
              << "  -w, --width-mm <mm>       Output width in millimeters (needs --height-mm)\n"
              << "  -H, --height-mm <mm>      Output height in millimeters (needs --width-mm)\n"
              << "  -b, --background <color>  Background color (#rrggbb, rgb(r,g,b), name or none)\n"
              << "  -m, --mode <grid|hexagonal|hex>\n"
              << "                            Sampling lattice (default: grid)\n"
              << "  -r, --render <color|halftone-black|halftone-white>\n"
              << "                            Render mode (default: color)\n"
              << "      --min-dot <px>        Smallest halftone dot radius (default: 0)\n"
              << "      --max-dot <px>        Largest halftone dot radius (default: diameter / 2)\n"
              << "  -j, --threads <n>         Worker threads (default: all cores)\n"
              << "  -h, --help                Show this help message\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string input_path;
    std::string output_path;
    CircleArtOptions options;

    try {
        // Parse arguments
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if ((arg == "-d" || arg == "--diameter") && has_value) {
                options.circle_diameter = parse_option_number(arg, argv[++i]);
            } else if ((arg == "-s" || arg == "--spacing") && has_value) {
                options.circle_spacing = parse_option_number(arg, argv[++i]);
            } else if ((arg == "-w" || arg == "--width-mm") && has_value) {
                options.output_width_mm = parse_option_number(arg, argv[++i]);
            } else if ((arg == "-H" || arg == "--height-mm") && has_value) {
                options.output_height_mm = parse_option_number(arg, argv[++i]);
            } else if ((arg == "-b" || arg == "--background") && has_value) {
                options.background = parse_color(argv[++i]);
            } else if ((arg == "-m" || arg == "--mode") && has_value) {
                options.sampling_mode = parse_sampling_mode(argv[++i]);
            } else if ((arg == "-r" || arg == "--render") && has_value) {
                options.render_mode = parse_render_mode(argv[++i]);
            } else if (arg == "--min-dot" && has_value) {
                options.min_dot_size = parse_option_number(arg, argv[++i]);
            } else if (arg == "--max-dot" && has_value) {
                options.max_dot_size = parse_option_number(arg, argv[++i]);
            } else if ((arg == "-j" || arg == "--threads") && has_value) {
                options.worker_count = parse_option_int(arg, argv[++i]);
            } else if (arg[0] != '-' && input_path.empty()) {
                input_path = arg;
            } else if (arg[0] != '-' && output_path.empty()) {
                output_path = arg;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        if (input_path.empty() || output_path.empty()) {
            std::cerr << "Error: Please specify an input image and an output SVG path." << std::endl;
            print_usage(argv[0]);
            return 1;
        }

        // Halftone dots default to the full range of a cell
        if (options.render_mode != RenderMode::Color &&
            !options.min_dot_size && !options.max_dot_size) {
            options.min_dot_size = 0.0;
            options.max_dot_size = options.circle_diameter / 2.0;
        }

        auto config = CircleArtConfig::from_options(options);

        std::cout << "Processing image: " << input_path << std::endl;
        std::cout << "Configuration:" << std::endl;
        std::cout << "  Circle diameter: " << config.circle_diameter() << " pixels" << std::endl;
        std::cout << "  Circle spacing:  " << config.circle_spacing() << " pixels" << std::endl;
        std::cout << "  Sample mode:     " << to_string(config.sampling_mode()) << std::endl;
        std::cout << "  Render mode:     " << to_string(config.render_mode()) << std::endl;
        if (config.is_halftone()) {
            std::cout << "  Dot radius:      " << config.min_dot_size() << " - "
                      << config.max_dot_size() << " pixels" << std::endl;
        }
        if (config.has_physical_size()) {
            std::cout << "  Output size:     " << *config.output_width_mm() << "mm x "
                      << *config.output_height_mm() << "mm" << std::endl;
        }

        CircleArt art(config);
        auto result = art.render_file(input_path, output_path);

        std::cout << "Circles: " << result.circles << " of " << result.points
                  << " points (" << result.skipped << " skipped)" << std::endl;
        std::cout << "Successfully generated SVG: " << output_path << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
