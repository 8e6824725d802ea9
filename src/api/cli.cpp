// src/api/cli.cpp

#include "cli.hpp"

#include <ostream>
#include <stdexcept>

#include "../classify/classifier_factory.hpp"
#include "../core/errors.hpp"
#include "../utils/dataset_io.hpp"

CommandLine parseArguments(int argc, const char* const argv[]) {
    CommandLine cli;
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            cli.config = loadConfig(argv[i + 1]);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            cli.show_help = true;
        } else if (arg == "--config" && has_value) {
            ++i;
        } else if (arg == "--train" && has_value) {
            cli.train_file = argv[++i];
        } else if (arg == "--test" && has_value) {
            cli.test_file = argv[++i];
        } else if (arg == "--algorithm" && has_value) {
            cli.config.algorithm = argv[++i];
        } else if (arg == "--neighbors" && has_value) {
            cli.config.neighbors = std::stoul(argv[++i]);
        } else if (arg == "--learning-rate" && has_value) {
            cli.config.learning_rate = std::stod(argv[++i]);
        } else if (arg == "--threshold" && has_value) {
            cli.config.threshold = std::stod(argv[++i]);
        } else if (arg == "--max-iterations" && has_value) {
            cli.config.max_iterations = std::stoul(argv[++i]);
        } else if (arg == "--seed" && has_value) {
            cli.config.seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (arg == "--parallel") {
            cli.config.parallel = true;
        } else if (arg == "--json") {
            cli.config.output_format = "json";
        } else if (arg == "--verbose") {
            cli.config.verbose = true;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return cli;
}

void printUsage(std::ostream& out, const std::string& program_name) {
    out << "Usage: " << program_name << " --train <file> --test <file> [options]\n";
    out << "Classifies every point of the test file using the training file.\n";
    out << "Each line holds whitespace separated components (\"re\" or \"re+imi\") followed by a label.\n";
    out << "Options:\n";
    out << "  --algorithm <name>     bayes, knn, slp or multiclass-slp (default: knn)\n";
    out << "  --neighbors <k>        Neighbors for knn (default: 1)\n";
    out << "  --learning-rate <r>    Perceptron learning rate (default: 1.0)\n";
    out << "  --threshold <t>        Fraction of training data allowed to stay misclassified (default: 0.0)\n";
    out << "  --max-iterations <n>   Perceptron pass limit (default: 10000)\n";
    out << "  --seed <s>             Seed for the perceptron random generator\n";
    out << "  --parallel             Classify test points on all hardware threads\n";
    out << "  --json                 Print results as JSON\n";
    out << "  --config <file>        JSON config file, later flags override it\n";
    out << "  --verbose              Report training progress on stderr\n";
    out << "  --help                 Show this help message\n";
}

int runCli(int argc, const char* const argv[], std::ostream& out, std::ostream& err) {
    std::string program_name = argc > 0 ? argv[0] : "point_classifier";

    CommandLine cli;
    try {
        cli = parseArguments(argc, argv);
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        printUsage(err, program_name);
        return 1;
    }

    if (cli.show_help) {
        printUsage(out, program_name);
        return 0;
    }
    if (cli.train_file.empty() || cli.test_file.empty()) {
        err << "Error: both --train and --test are required" << std::endl;
        printUsage(err, program_name);
        return 1;
    }

    try {
        const ClassifierConfig& config = cli.config;
        config.validate();

        auto train_data = dataset_io::loadDataset<std::string>(cli.train_file);
        auto test_data = dataset_io::loadDataset<std::string>(cli.test_file);

        // stdout only carries the results
        if (config.verbose) {
            err << "Algorithm: " << config.algorithm << std::endl;
            err << "Training points: " << train_data.size() << std::endl;
            err << "Test points: " << test_data.size() << std::endl;
        }

        auto classifier = ClassifierFactory<std::string>::create(config);
        auto results = classifier->classify(train_data, test_data);

        if (config.output_format == "json") {
            out << dataset_io::resultsToJson(results).dump(2) << std::endl;
        } else {
            out << dataset_io::formatResults(results);
        }
    } catch (const ParseError& e) {
        err << "Error: could not parse data: " << e.what() << std::endl;
        return 1;
    } catch (const PreconditionError& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        err << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
