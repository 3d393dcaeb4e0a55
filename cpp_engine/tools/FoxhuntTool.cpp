#include "FoxSheaf.h"
#include "FoxSheafErrors.h"

#include "noise_model.h"
#include "receiver.h"
#include "report_csv.h"
#include "transmitter.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr double kPI = 3.14159265358979323846;

std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

bool parsePoint(const std::string& text, Eigen::Vector2d& out) {
    const auto comma = text.find(',');
    if (comma == std::string::npos) {
        return false;
    }
    try {
        out = Eigen::Vector2d(std::stod(text.substr(0, comma)), std::stod(text.substr(comma + 1)));
    } catch (const std::exception&) {
        return false;
    }
    return out.allFinite();
}

void printUsage() {
    std::cout << "FoxhuntTool usage:\n"
              << "  FoxhuntTool [--tx x,y] [--power W] [--rx x,y]... [--rssi-rx x,y]...\n"
              << "              [--beamwidth-deg d] [--rssi-noise W] [--outlier-deg d]\n"
              << "              [--topology flat|hub] [--restarts n] [--seed n]\n"
              << "              [--reports-in file] [--reports-out file]\n"
              << "              [--legacy-in file] [--legacy-quantity bearing|rssi|both]\n"
              << "              [--filtration-out file] [--filtration-at x,y] [--edges-out file] [--levels n]\n"
              << "Without --reports-in or --legacy-in a scenario is generated from --tx/--rx/--rssi-rx.\n"
              << "The filtration is taken at the fused assignment unless --filtration-at names a location.\n";
}

bool exportEdgesCSV(const std::string& filename, const foxsheaf::FoxSheaf& sheaf,
                    const std::vector<foxsheaf::EdgeDiscrepancy>& discrepancies) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        std::cerr << "Failed to open file: " << filename << "\n";
        return false;
    }
    const auto& cx = sheaf.complex();
    out << "edge,source,target,map,discrepancy\n";
    out << std::setprecision(12);
    for (const auto& d : discrepancies) {
        out << d.edge << ','
            << cx.cell(d.source).name << ','
            << cx.cell(d.target).name << ','
            << sheaf.registry().map(d.edge).label() << ','
            << d.value << '\n';
    }
    return true;
}

bool exportFiltrationCSV(const std::string& filename, const foxsheaf::FoxSheaf& sheaf,
                         const foxsheaf::ConsistencyFiltration& filtration, int levels) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        std::cerr << "Failed to open file: " << filename << "\n";
        return false;
    }

    std::vector<double> thresholds = filtration.criticalThresholds();
    if (levels > 1 && !thresholds.empty()) {
        const double top = thresholds.back();
        thresholds.clear();
        for (int i = 0; i < levels; ++i) {
            thresholds.push_back(top * static_cast<double>(i) / static_cast<double>(levels - 1));
        }
    } else if (thresholds.empty() || thresholds.front() > 0.0) {
        thresholds.insert(thresholds.begin(), 0.0);
    }

    out << "threshold,edges,cells,components\n";
    out << std::setprecision(12);
    for (const auto& level : filtration.levels(thresholds)) {
        out << level.threshold << ','
            << level.sub.edges.size() << ','
            << level.sub.cells.size() << ','
            << level.sub.componentCount(sheaf.complex()) << '\n';
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Eigen::Vector2d tx_loc(10.0, 10.0);
    double power_W = 1000.0;
    std::vector<Eigen::Vector2d> bearing_rx;
    std::vector<Eigen::Vector2d> rssi_rx;
    double beamwidth_deg = 0.0;
    double rssi_noise_W = 0.0;
    double outlier_deg = 0.0;
    foxsheaf::SheafTopology topology = foxsheaf::SheafTopology::Hub;
    int restarts = 4;
    unsigned int seed = 1337u;
    int levels = 0;
    std::string reports_in;
    std::string reports_out;
    std::string filtration_out;
    std::string edges_out;
    std::string legacy_in;
    std::vector<foxsheaf::QuantityType> legacy_quantities = {foxsheaf::QuantityType::Bearing};
    std::optional<Eigen::Vector2d> filtration_at;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "--tx" || arg == "--rx" || arg == "--rssi-rx" || arg == "--filtration-at") &&
                i + 1 < argc) {
                Eigen::Vector2d p;
                if (!parsePoint(argv[++i], p)) {
                    std::cout << "Expected x,y after " << arg << "\n";
                    printUsage();
                    return 1;
                }
                if (arg == "--tx") {
                    tx_loc = p;
                } else if (arg == "--filtration-at") {
                    filtration_at = p;
                } else if (arg == "--rx") {
                    bearing_rx.push_back(p);
                } else {
                    rssi_rx.push_back(p);
                }
            } else if (arg == "--power" && i + 1 < argc) {
                power_W = std::stod(argv[++i]);
            } else if (arg == "--beamwidth-deg" && i + 1 < argc) {
                beamwidth_deg = std::stod(argv[++i]);
            } else if (arg == "--rssi-noise" && i + 1 < argc) {
                rssi_noise_W = std::stod(argv[++i]);
            } else if (arg == "--outlier-deg" && i + 1 < argc) {
                outlier_deg = std::stod(argv[++i]);
            } else if (arg == "--topology" && i + 1 < argc) {
                if (!foxsheaf::parseTopology(toLower(argv[++i]), topology)) {
                    std::cout << "Unsupported topology: " << argv[i] << "\n";
                    printUsage();
                    return 1;
                }
            } else if (arg == "--restarts" && i + 1 < argc) {
                restarts = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<unsigned int>(std::stoul(argv[++i]));
            } else if (arg == "--levels" && i + 1 < argc) {
                levels = std::stoi(argv[++i]);
            } else if (arg == "--reports-in" && i + 1 < argc) {
                reports_in = argv[++i];
            } else if (arg == "--legacy-in" && i + 1 < argc) {
                legacy_in = argv[++i];
            } else if (arg == "--legacy-quantity" && i + 1 < argc) {
                const std::string q = toLower(argv[++i]);
                foxsheaf::QuantityType parsed = foxsheaf::QuantityType::Bearing;
                if (q == "both") {
                    legacy_quantities = {foxsheaf::QuantityType::Bearing, foxsheaf::QuantityType::Rssi};
                } else if (foxsheaf::parseQuantityType(q, parsed)) {
                    legacy_quantities = {parsed};
                } else {
                    std::cout << "Unsupported legacy quantity: " << argv[i] << "\n";
                    printUsage();
                    return 1;
                }
            } else if (arg == "--reports-out" && i + 1 < argc) {
                reports_out = argv[++i];
            } else if (arg == "--filtration-out" && i + 1 < argc) {
                filtration_out = argv[++i];
            } else if (arg == "--edges-out" && i + 1 < argc) {
                edges_out = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cout << "Bad numeric argument: " << e.what() << "\n";
        printUsage();
        return 1;
    }

    std::vector<foxsheaf::ReceptionReport> reports;
    const foxsheaf::PropagationLaw law;
    std::mt19937 rng(seed);

    const bool from_files = !reports_in.empty() || !legacy_in.empty();
    if (from_files) {
        std::string error;
        if (!reports_in.empty() && !foxsheaf::measurement::readReportsCSV(reports_in, reports, &error)) {
            std::cerr << "[FAIL] " << error << "\n";
            return 1;
        }
        if (!legacy_in.empty() &&
            !foxsheaf::measurement::readLegacyReportsCSV(legacy_in, "legacy", legacy_quantities, reports, &error)) {
            std::cerr << "[FAIL] " << error << "\n";
            return 1;
        }
    } else {
        if (bearing_rx.empty() && rssi_rx.empty()) {
            bearing_rx = {Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(20.0, 0.0), Eigen::Vector2d(0.0, 20.0)};
        }

        foxsheaf::measurement::Transmitter tx;
        tx.location = tx_loc;
        tx.power_W = power_W;

        foxsheaf::measurement::NoiseModel noise;
        noise.bearing_beamwidth_rad = beamwidth_deg * kPI / 180.0;
        noise.rssi_noise_W = rssi_noise_W;

        for (std::size_t k = 0; k < bearing_rx.size(); ++k) {
            foxsheaf::measurement::Receiver rx("df" + std::to_string(k), foxsheaf::QuantityType::Bearing, noise);
            reports.push_back(rx.addReception(0.0, bearing_rx[k], tx, law, rng));
        }
        for (std::size_t k = 0; k < rssi_rx.size(); ++k) {
            foxsheaf::measurement::Receiver rx("rssi" + std::to_string(k), foxsheaf::QuantityType::Rssi, noise);
            reports.push_back(rx.addReception(0.0, rssi_rx[k], tx, law, rng));
        }

        // Corrupt the first bearing; with --filtration-at on the true location
        // the filtration then drops only that report's edge.
        if (outlier_deg != 0.0 && !bearing_rx.empty()) {
            reports.front().value = foxsheaf::wrapAngle(reports.front().value + outlier_deg * kPI / 180.0);
        }
    }

    if (!reports_out.empty()) {
        std::string error;
        if (!foxsheaf::measurement::writeReportsCSV(reports_out, reports, &error)) {
            std::cerr << "Failed to write reports: " << error << "\n";
            return 1;
        }
        std::cout << "Wrote " << reports.size() << " reports to: " << reports_out << "\n";
    }

    // Start from the receiver centroid.
    Eigen::Vector2d centroid = Eigen::Vector2d::Zero();
    for (const auto& r : reports) {
        centroid += r.rx_location;
    }
    if (!reports.empty()) {
        centroid /= static_cast<double>(reports.size());
    }

    try {
        foxsheaf::FoxSheafBuilder builder(law, topology);
        if (from_files) {
            builder.setInitialGuess(centroid + Eigen::Vector2d(1.0, 1.0));
        } else {
            builder.setInitialGuess(centroid + Eigen::Vector2d(1.0, 1.0), power_W);
        }
        const auto sheaf = builder.build(reports);

        foxsheaf::FusionOptions opts;
        opts.restarts = restarts;
        opts.seed = seed;
        const foxsheaf::FusionResult result = sheaf->fuse(opts);

        const Eigen::Vector2d loc = sheaf->location(result.assignment);
        std::cout << std::setprecision(8)
                  << "topology:     " << foxsheaf::toString(topology) << "\n"
                  << "cells/edges:  " << sheaf->complex().cellCount() << " / " << sheaf->complex().edgeCount() << "\n"
                  << "location:     (" << loc.x() << ", " << loc.y() << ")\n";
        if (const auto p = sheaf->power(result.assignment)) {
            std::cout << "power:        " << *p << " W\n";
        }
        std::cout << "radius:       " << result.radius << "\n"
                  << "termination:  " << foxsheaf::toString(result.termination)
                  << " (" << result.iterations << " iterations, " << result.evaluations << " evaluations)\n";
        if (!from_files) {
            std::cout << "error:        " << (loc - tx_loc).norm() << " m\n";
        }
        if (result.warning) {
            std::cerr << "[WARN] " << result.warning->message << "\n";
        }

        if (!edges_out.empty() && exportEdgesCSV(edges_out, *sheaf, result.discrepancies)) {
            std::cout << "Wrote edge discrepancies to: " << edges_out << "\n";
        }
        if (!filtration_out.empty()) {
            // A contaminated fused point can be equidistant from good and bad reports.
            const foxsheaf::Assignment at = filtration_at
                ? sheaf->assignmentAt(*filtration_at, sheaf->power(result.assignment).value_or(power_W))
                : result.assignment;
            const auto filtration = sheaf->filtration(at);
            if (exportFiltrationCSV(filtration_out, *sheaf, filtration, levels)) {
                std::cout << "Wrote filtration to: " << filtration_out << "\n";
            }
        }
    } catch (const foxsheaf::FoxSheafError& e) {
        std::cerr << "[FAIL] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
