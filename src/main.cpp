#include "SCS.hpp"
#include "ConfigReader.hpp"
#include "CoordinateSearch.hpp"
#include "CoordinateSystem.hpp"
#include "CoordinateTransformer.hpp"
#include <petsc.h>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

static char help[] = "scs_search - SWEREF 99 coordinate search\n"
                    "Usage: scs_search [options]\n\n"
                    "Searches the -text value, or each line of standard input when no\n"
                    "text is given, and prints the point in the map reference.\n\n"
                    "Options:\n"
                    "  -text <coordinates>       Coordinate text to search\n"
                    "  -c <file>                 Configuration file (.config)\n"
                    "  -generate_config <file>   Write a template configuration and exit\n"
                    "  -wkid <n>                 Target spatial reference (default 3857)\n"
                    "  -lon <deg>                Map center longitude for zone ranking\n"
                    "  -preference <p>           auto, tm or zone\n\n"
                    "Examples:\n"
                    "  scs_search -text \"6580822 674032\"\n"
                    "  scs_search -wkid 4326 -lon 13.4 -text \"E 150000 N 6200000\"\n"
                    "  scs_search -c search.config < coordinates.txt\n"
                    "  scs_search -generate_config search.config\n\n";

namespace {

struct CommandOptions {
    std::string config_file;
    std::optional<int> wkid;
    std::optional<double> longitude;
    std::string preference;
    std::vector<std::string> inputs;
};

PetscErrorCode readOptions(CommandOptions& opts) {
    PetscErrorCode ierr;
    PetscBool found = PETSC_FALSE;

    char config_file[PETSC_MAX_PATH_LEN] = "";
    ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                 sizeof(config_file), &found); CHKERRQ(ierr);
    if (found) opts.config_file = config_file;

    PetscInt wkid = 0;
    ierr = PetscOptionsGetInt(nullptr, nullptr, "-wkid", &wkid, &found); CHKERRQ(ierr);
    if (found) opts.wkid = static_cast<int>(wkid);

    PetscReal lon = 0.0;
    ierr = PetscOptionsGetReal(nullptr, nullptr, "-lon", &lon, &found); CHKERRQ(ierr);
    if (found) opts.longitude = static_cast<double>(lon);

    char preference[64] = "";
    ierr = PetscOptionsGetString(nullptr, nullptr, "-preference", preference,
                                 sizeof(preference), &found); CHKERRQ(ierr);
    if (found) opts.preference = preference;

    char text[1024] = "";
    ierr = PetscOptionsGetString(nullptr, nullptr, "-text", text,
                                 sizeof(text), &found); CHKERRQ(ierr);
    if (found) opts.inputs.push_back(text);

    return 0;
}

void printResult(const std::string& input, const SCS::SearchResult& result) {
    std::cout << input << "\n";
    std::cout << "  Projection:   " << result.projection->name
              << " (" << result.projection->code << ")\n";
    std::cout << "  Format:       " << SCS::toString(result.format) << "\n";
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "  Source:       E " << result.easting << "  N " << result.northing << "\n";
    std::cout << "  Map point:    " << result.point.x << ", " << result.point.y
              << " (wkid " << result.point.spatial_reference_id << ")\n";
    std::cout << std::setprecision(2);
    std::cout << "  Confidence:   " << result.confidence << "\n";
    std::cout.unsetf(std::ios::floatfield);
    std::cout << std::setprecision(6);

    if (!result.alternatives.empty()) {
        std::cout << "  Alternatives:";
        for (const auto* alt : result.alternatives) {
            std::cout << " " << alt->code;
        }
        std::cout << "\n";
    }
    for (const auto& warning : result.warnings) {
        std::cout << "  Warning:      " << warning << "\n";
    }
}

void printError(const std::string& input, const std::string& key,
                const std::vector<std::string>& warnings) {
    std::cout << input << "\n";
    std::cout << "  Error:        " << key
              << " [" << SCS::toString(SCS::errorCategory(key)) << "]\n";
    for (const auto& warning : warnings) {
        std::cout << "  Warning:      " << warning << "\n";
    }
}

int runSearches(CommandOptions& opts) {
    SCS::SearchConfig config;
    if (!opts.config_file.empty()) {
        SCS::ConfigReader reader;
        if (!reader.loadFile(opts.config_file)) {
            return 1;
        }
        auto check = reader.validate();
        for (const auto& warning : check.warnings) {
            std::cerr << "Warning: " << warning << std::endl;
        }
        if (!reader.parseSearchConfig(config)) {
            return 1;
        }
    }

    // Command line overrides the configuration file
    if (opts.wkid) config.map_wkid = *opts.wkid;
    if (opts.longitude) config.center_longitude = *opts.longitude;
    if (!opts.preference.empty()) {
        auto preference = SCS::parsePreference(opts.preference);
        if (!preference) {
            std::cerr << "Error: Unknown preference: " << opts.preference << std::endl;
            std::cerr << "Run with -help for usage information" << std::endl;
            return 1;
        }
        config.preference = *preference;
    }

    if (opts.inputs.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty()) opts.inputs.push_back(line);
        }
    }
    if (opts.inputs.empty()) {
        std::cerr << "Error: No coordinate text given" << std::endl;
        std::cerr << "Run with -help for usage information" << std::endl;
        return 1;
    }

    try {
        auto module = std::make_shared<SCS::ProjModule>();
        auto cache = std::make_shared<SCS::ModuleLoadCache>(config.load_timeout);
        auto transformer = std::make_shared<SCS::CoordinateTransformer>(
            module, cache, static_cast<size_t>(config.worker_threads));
        auto map_view = std::make_shared<SCS::StaticMapView>(config.map_wkid,
                                                             config.center_longitude);

        std::string current_input;
        SCS::SearchOptions options;
        options.preference = config.preference;
        options.on_success = [&current_input](const SCS::SearchResult& result) {
            printResult(current_input, result);
        };
        options.on_error = [&current_input](const std::string& key,
                                            const std::vector<std::string>& warnings) {
            printError(current_input, key, warnings);
        };

        SCS::CoordinateSearch search(transformer, map_view, options,
                                     static_cast<size_t>(config.worker_threads));

        // One search at a time so every input is reported
        bool all_ok = true;
        for (const auto& input : opts.inputs) {
            current_input = input;
            SCS::SearchOutcome outcome = search.searchCoordinates(input).get();
            if (outcome.status != SCS::SearchStatus::DELIVERED) all_ok = false;
        }
        std::cout.flush();
        return all_ok ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    int exit_code = 0;
    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        // PetscInitialize already printed help[]
        PetscBool show_help = PETSC_FALSE;
        ierr = PetscOptionsHasName(nullptr, nullptr, "-help", &show_help); CHKERRQ(ierr);
        if (show_help) {
            ierr = PetscFinalize();
            return 0;
        }

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config = PETSC_FALSE;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                SCS::ConfigReader::generateTemplate(generate_config);
                PetscPrintf(comm, "Edit this file to customize the search.\n");
            }
            ierr = PetscFinalize();
            return 0;
        }

        CommandOptions opts;
        ierr = readOptions(opts); CHKERRQ(ierr);

        // Searches are serial; other ranks only take part in PETSc setup
        if (rank == 0) {
            exit_code = runSearches(opts);
        }
    }

    ierr = PetscFinalize();
    if (ierr) return static_cast<int>(ierr);
    return exit_code;
}
