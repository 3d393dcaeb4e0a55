// main_vis.cpp
// - Generates a foxhunt scenario from the measurement model and fuses it with FoxSheaf
// - Plots receivers, bearing rays, true and fused transmitter locations
// - Plots the consistency filtration curve (retained edges vs threshold) and per-edge discrepancies,
//   taken at the fused assignment or, on request, at the true transmitter location
// - Fusion errors are shown in the status line instead of aborting

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "FoxSheaf.h"
#include "FoxSheafErrors.h"

#include "noise_model.h"
#include "receiver.h"
#include "transmitter.h"

#include "imgui.h"
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

static constexpr double kPI = 3.14159265358979323846;

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

// ============================================================
// Scenario state (UI -> measurement model -> fusion)
// ============================================================

struct ScenarioUI {
    float tx[2] = {10.0f, 10.0f};
    float power_W = 1000.0f;
    float rx[3][2] = {{0.0f, 0.0f}, {20.0f, 0.0f}, {0.0f, 20.0f}};
    int rssi_receivers = 0;
    float beamwidth_deg = 2.0f;
    float rssi_noise_W = 0.0f;
    float outlier_deg = 0.0f;
    int topology = 1; // 0 flat, 1 hub
    int restarts = 4;
    int seed = 1337;
    float ray_length = 40.0f;
    bool filtration_at_truth = false;
};

struct FusedView {
    bool valid = false;
    std::string status;

    std::vector<foxsheaf::ReceptionReport> reports;
    double fused_x = 0.0;
    double fused_y = 0.0;
    double radius = 0.0;
    std::string termination;

    std::string filtration_label;
    std::vector<double> thresholds;
    std::vector<double> edge_counts;
    std::vector<double> components;

    std::vector<double> edge_index;
    std::vector<double> edge_value;
};

static FusedView run_scenario(const ScenarioUI& ui) {
    FusedView view;

    foxsheaf::measurement::Transmitter tx;
    tx.location = Eigen::Vector2d(ui.tx[0], ui.tx[1]);
    tx.power_W = ui.power_W;

    foxsheaf::measurement::NoiseModel noise;
    noise.bearing_beamwidth_rad = ui.beamwidth_deg * kPI / 180.0;
    noise.rssi_noise_W = ui.rssi_noise_W;

    const foxsheaf::PropagationLaw law;
    std::mt19937 rng(static_cast<std::uint32_t>(ui.seed));

    for (int k = 0; k < 3; ++k) {
        const bool rssi = k < ui.rssi_receivers;
        foxsheaf::measurement::Receiver rx("rx" + std::to_string(k),
                                           rssi ? foxsheaf::QuantityType::Rssi : foxsheaf::QuantityType::Bearing,
                                           noise);
        view.reports.push_back(rx.addReception(0.0, Eigen::Vector2d(ui.rx[k][0], ui.rx[k][1]), tx, law, rng));
    }
    for (auto& r : view.reports) {
        if (r.quantity == foxsheaf::QuantityType::Bearing && ui.outlier_deg != 0.0f) {
            r.value = foxsheaf::wrapAngle(r.value + ui.outlier_deg * kPI / 180.0);
            break;
        }
    }

    Eigen::Vector2d centroid = Eigen::Vector2d::Zero();
    for (const auto& r : view.reports) {
        centroid += r.rx_location;
    }
    centroid /= static_cast<double>(view.reports.size());

    try {
        foxsheaf::FoxSheafBuilder builder(law, ui.topology == 0 ? foxsheaf::SheafTopology::Flat
                                                                : foxsheaf::SheafTopology::Hub);
        builder.setInitialGuess(centroid + Eigen::Vector2d(1.0, 1.0), ui.power_W);
        const auto sheaf = builder.build(view.reports);

        foxsheaf::FusionOptions opts;
        opts.restarts = ui.restarts;
        opts.seed = static_cast<std::uint32_t>(ui.seed);
        const auto result = sheaf->fuse(opts);

        const Eigen::Vector2d loc = sheaf->location(result.assignment);
        view.fused_x = loc.x();
        view.fused_y = loc.y();
        view.radius = result.radius;
        view.termination = foxsheaf::toString(result.termination);

        // The fused point of a contaminated scenario can sit as far from good
        // bearings as from the outlier; the truth view separates them.
        const foxsheaf::Assignment at = ui.filtration_at_truth
            ? sheaf->assignmentAt(tx.location, ui.power_W)
            : result.assignment;
        view.filtration_label = ui.filtration_at_truth ? "at true location" : "at fused assignment";

        for (const auto& d : sheaf->discrepancies(at)) {
            view.edge_index.push_back(static_cast<double>(d.edge));
            view.edge_value.push_back(d.value);
        }

        const auto filtration = sheaf->filtration(at);
        for (const auto& level : filtration.criticalLevels()) {
            view.thresholds.push_back(level.threshold);
            view.edge_counts.push_back(static_cast<double>(level.sub.edges.size()));
            view.components.push_back(static_cast<double>(level.sub.componentCount(sheaf->complex())));
        }

        view.valid = true;
        view.status = result.warning ? result.warning->message : "ok";
    } catch (const foxsheaf::FoxSheafError& e) {
        view.status = e.what();
    }
    return view;
}

int main(int, char**) {
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "FoxSheaf Foxhunt", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

// Docking flags and APIs only exist on the docking branch of ImGui.
#ifdef IMGUI_HAS_DOCK
    ImGui::GetIO().ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif

    ImPlot::CreateContext();
    implot_ctx = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3 = true;

    ScenarioUI ui;
    FusedView view = run_scenario(ui);
    bool auto_fuse = false;

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifdef IMGUI_HAS_DOCK
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        // --- Controls ---
        bool changed = false;
        if (ImGui::Begin("Scenario")) {
            changed |= ImGui::DragFloat2("Transmitter (m)", ui.tx, 0.1f);
            changed |= ImGui::DragFloat("Power (W)", &ui.power_W, 1.0f, 1.0f, 1.0e6f);
            for (int k = 0; k < 3; ++k) {
                const std::string label = "Receiver " + std::to_string(k) + " (m)";
                changed |= ImGui::DragFloat2(label.c_str(), ui.rx[k], 0.1f);
            }
            changed |= ImGui::SliderInt("RSSI receivers", &ui.rssi_receivers, 0, 3);
            changed |= ImGui::SliderFloat("Beamwidth (deg)", &ui.beamwidth_deg, 0.0f, 30.0f);
            changed |= ImGui::DragFloat("RSSI noise (W)", &ui.rssi_noise_W, 0.001f, 0.0f, 10.0f);
            changed |= ImGui::SliderFloat("Outlier (deg)", &ui.outlier_deg, -180.0f, 180.0f);

            const char* topologies[] = {"flat", "hub"};
            changed |= ImGui::Combo("Topology", &ui.topology, topologies, 2);
            changed |= ImGui::SliderInt("Restarts", &ui.restarts, 0, 16);
            changed |= ImGui::InputInt("Seed", &ui.seed);
            ImGui::SliderFloat("Ray length (m)", &ui.ray_length, 5.0f, 200.0f);
            changed |= ImGui::Checkbox("Filtration at true location", &ui.filtration_at_truth);

            ImGui::Checkbox("Fuse on change", &auto_fuse);
            ImGui::SameLine();
            if (ImGui::Button("Fuse") || (auto_fuse && changed)) {
                view = run_scenario(ui);
            }

            ImGui::Separator();
            if (view.valid) {
                ImGui::Text("Fused: (%.4f, %.4f)", view.fused_x, view.fused_y);
                ImGui::Text("Error: %.4f m", std::hypot(view.fused_x - ui.tx[0], view.fused_y - ui.tx[1]));
                ImGui::Text("Consistency radius: %.6g", view.radius);
                ImGui::Text("Termination: %s", view.termination.c_str());
            }
            ImGui::TextWrapped("Status: %s", view.status.c_str());
        }
        ImGui::End();

        // --- Map: receivers, bearing rays, truth and fused location ---
        if (ImGui::Begin("Map")) {
            if (ImPlot::BeginPlot("##map", ImVec2(-1, -1), ImPlotFlags_Equal)) {
                ImPlot::SetupAxes("x (m)", "y (m)");

                std::vector<double> rx_x;
                std::vector<double> rx_y;
                for (const auto& r : view.reports) {
                    rx_x.push_back(r.rx_location.x());
                    rx_y.push_back(r.rx_location.y());
                }
                if (!rx_x.empty()) {
                    ImPlot::PlotScatter("Receivers", rx_x.data(), rx_y.data(), static_cast<int>(rx_x.size()));
                }

                for (std::size_t i = 0; i < view.reports.size(); ++i) {
                    const auto& r = view.reports[i];
                    if (r.quantity != foxsheaf::QuantityType::Bearing) {
                        continue;
                    }
                    // Bearing is clockwise from +y.
                    const double xs[2] = {r.rx_location.x(), r.rx_location.x() + ui.ray_length * std::sin(r.value)};
                    const double ys[2] = {r.rx_location.y(), r.rx_location.y() + ui.ray_length * std::cos(r.value)};
                    const std::string label = "Bearing " + r.receiver_id;
                    ImPlot::PlotLine(label.c_str(), xs, ys, 2);
                }

                const double tx_x = ui.tx[0];
                const double tx_y = ui.tx[1];
                ImPlot::PlotScatter("Transmitter", &tx_x, &tx_y, 1);
                if (view.valid) {
                    ImPlot::PlotScatter("Fused", &view.fused_x, &view.fused_y, 1);
                }
                ImPlot::EndPlot();
            }
        }
        ImGui::End();

        // --- Filtration curve and per-edge discrepancies ---
        if (ImGui::Begin("Filtration")) {
            ImGui::Text("Discrepancies %s", view.filtration_label.c_str());
            if (ImPlot::BeginPlot("Retained edges vs threshold")) {
                ImPlot::SetupAxes("threshold", "count");
                if (!view.thresholds.empty()) {
                    const int n = static_cast<int>(view.thresholds.size());
                    ImPlot::PlotLine("edges", view.thresholds.data(), view.edge_counts.data(), n);
                    ImPlot::PlotLine("components", view.thresholds.data(), view.components.data(), n);
                }
                ImPlot::EndPlot();
            }
            if (ImPlot::BeginPlot("Edge discrepancy")) {
                ImPlot::SetupAxes("edge", "discrepancy");
                if (!view.edge_index.empty()) {
                    ImPlot::PlotBars("discrepancy", view.edge_index.data(), view.edge_value.data(),
                                     static_cast<int>(view.edge_index.size()), 0.6);
                }
                ImPlot::EndPlot();
            }
        }
        ImGui::End();

        ImGui::Render();

        int fb_w = 0, fb_h = 0;
        glfwGetFramebufferSize(window, &fb_w, &fb_h);
        if (fb_w > 0 && fb_h > 0) {
            glViewport(0, 0, fb_w, fb_h);
            glClearColor(0.06f, 0.06f, 0.07f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        }

        glfwSwapBuffers(window);
    }

    // Cleanup
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
