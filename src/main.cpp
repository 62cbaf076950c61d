#include "MarkovModel.h"
#include "ChainGenerator.h"
#include "SentenceGenerator.h"
#include "ModelStore.h"
#include "Errors.h"
#include "Utils.h"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>

namespace {

struct Options {
    int numWords = 30;
    int ngramSize = 2;
    int minWords = 5;
    int attempts = 100;
    std::optional<uint32_t> seed;
    std::string corpusPath;
    std::string saveModelPath;
    std::string loadModelPath;
    bool raw = false;
    bool stopAtDeadEnd = false;
    bool verbose = false;
};

void printUsage(std::ostream& os) {
    os << "usage: textchain [options] < corpus.txt\n"
          "Generates plausible new sentences from a corpus provided on STDIN.\n\n"
          "  -w, --num-words N     maximum number of words in the result (default 30)\n"
          "  -n, --ngram-size N    n-gram size (default 2)\n"
          "  -m, --min-words N     minimum sentence length (default 5)\n"
          "  -a, --attempts N      sentence attempts before giving up (default 100)\n"
          "  -s, --seed N          random seed\n"
          "  -f, --file PATH       read the corpus from PATH instead of STDIN\n"
          "      --raw             print a raw chain of N words instead of a sentence\n"
          "      --stop-at-dead-end  end the chain at a key with no successors\n"
          "      --save-model PATH write the built model to PATH\n"
          "      --load-model PATH load a saved model instead of reading a corpus\n"
          "  -v, --verbose         print model statistics and timings to STDERR\n"
          "  -h, --help            show this message\n";
}

bool parseInt(const std::string& text, int& out) {
    try {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (used != text.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Returns 0 to continue, otherwise the exit code.
int parseArgs(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        auto intValue = [&](int& out, int minValue) {
            std::string text;
            return value(text) && parseInt(text, out) && out >= minValue;
        };

        bool ok = true;
        if (arg == "-h" || arg == "--help") {
            printUsage(std::cout);
            return -1;
        } else if (arg == "-w" || arg == "--num-words") {
            ok = intValue(opt.numWords, 1);
        } else if (arg == "-n" || arg == "--ngram-size") {
            ok = intValue(opt.ngramSize, 1);
        } else if (arg == "-m" || arg == "--min-words") {
            ok = intValue(opt.minWords, 1);
        } else if (arg == "-a" || arg == "--attempts") {
            ok = intValue(opt.attempts, 1);
        } else if (arg == "-s" || arg == "--seed") {
            int s = 0;
            ok = intValue(s, 0);
            if (ok) opt.seed = static_cast<uint32_t>(s);
        } else if (arg == "-f" || arg == "--file") {
            ok = value(opt.corpusPath);
        } else if (arg == "--save-model") {
            ok = value(opt.saveModelPath);
        } else if (arg == "--load-model") {
            ok = value(opt.loadModelPath);
        } else if (arg == "--raw") {
            opt.raw = true;
        } else if (arg == "--stop-at-dead-end") {
            opt.stopAtDeadEnd = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opt.verbose = true;
        } else {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            printUsage(std::cerr);
            return 2;
        }

        if (!ok) {
            std::cerr << "Error: invalid value for '" << arg << "'\n";
            printUsage(std::cerr);
            return 2;
        }
    }
    return 0;
}

WordModel obtainModel(const Options& opt) {
    ModelStore store;
    if (!opt.loadModelPath.empty()) return store.loadFile(opt.loadModelPath);

    if (!opt.corpusPath.empty()) {
        std::ifstream in(opt.corpusPath);
        if (!in.is_open()) throw IoError("open", opt.corpusPath);
        return buildWordModel(in, opt.ngramSize);
    }
    return buildWordModel(std::cin, opt.ngramSize);
}

void printModelStats(const WordModel& model, long long buildMs) {
    std::cerr << "Model statistics\n";
    std::cerr << "  n-gram size: " << model.order() << "\n";
    std::cerr << "  keys: " << model.size() << "\n";
    std::cerr << "  transitions (key, successor pairs): " << model.transitionCount() << "\n";
    std::cerr << "  distinct successor words: " << model.vocabularySize() << "\n";
    std::cerr << "  build/load time: " << buildMs << " ms\n";
}

}

int main(int argc, char** argv) {
    using clock = std::chrono::high_resolution_clock;

    Options opt;
    int rc = parseArgs(argc, argv, opt);
    if (rc != 0) return rc < 0 ? 0 : rc;

    if (opt.loadModelPath.empty() && opt.corpusPath.empty() && isatty(STDIN_FILENO)) {
        std::cerr << "Error: corpus must be provided on STDIN.\n";
        return 1;
    }

    std::mt19937 rng = opt.seed ? Utils::makeRng(*opt.seed) : Utils::makeRng();
    DeadEndPolicy policy = opt.stopAtDeadEnd ? DeadEndPolicy::Stop : DeadEndPolicy::Reseed;

    try {
        auto t0 = clock::now();
        WordModel model = obtainModel(opt);
        auto t1 = clock::now();
        if (opt.verbose) {
            printModelStats(model, std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count());
        }

        if (!opt.saveModelPath.empty()) {
            ModelStore().saveFile(model, opt.saveModelPath);
            if (opt.verbose) std::cerr << "  Wrote model -> " << opt.saveModelPath << "\n";
        }

        auto t2 = clock::now();
        if (opt.raw) {
            ChainGenerator<std::string> gen(model, rng, policy);
            std::cout << Utils::join(gen.generate(opt.numWords)) << "\n";
        } else {
            SentenceOptions sopt;
            sopt.minWords = opt.minWords;
            sopt.maxAttempts = opt.attempts;
            sopt.deadEnd = policy;
            SentenceGenerator gen(model, rng, sopt);
            std::cout << gen.generate(opt.numWords) << "\n";
            if (opt.verbose) std::cerr << "  Sentence attempts: " << gen.lastAttempts() << "\n";
        }
        auto t3 = clock::now();
        if (opt.verbose) {
            std::cerr << "  Generation time: " << std::chrono::duration_cast<std::chrono::milliseconds>(t3 - t2).count() << " ms\n";
        }
    } catch (const SentenceTooShortError& e) {
        std::cerr << "Error: Could not generate sentence with at least " << e.minWords() << " words.\n";
        return 1;
    } catch (const MarkovError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
