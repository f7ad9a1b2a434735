//
// Gnuplot output for the console driver: landscape grid, one data file per
// iteration and an animation script that replays them.
//

#ifndef EVOSWARM_PLOTTER_HPP
#define EVOSWARM_PLOTTER_HPP

#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib> // std::system
#include "../fitness/fitness_function.hpp"

namespace evoswarm::plot {

/**
 * Utility to close all currently open Gnuplot windows.
 */
inline void closeGnuplotWindows() {
    // pkill exits with 1 when no window is open
    static_cast<void>(std::system("pkill -f gnuplot > /dev/null 2>&1"));
}

// Names frame files: baseName_iter_0.dat, baseName_iter_1.dat, ...
inline std::string makeFrameName(const std::string& baseName, size_t iter) {
    return baseName + "_iter_" + std::to_string(iter) + ".dat";
}

/**
 * 1. SAVE FUNCTION GRID (Background for the animation)
 * Evaluates a 2D fitness function on a regular grid over its domain.
 * Returns false (and writes nothing) for functions that are not 2D.
 */
inline bool saveFunctionGrid(const std::string& filename,
                             const fitness::FitnessFunction& func,
                             int resolution = 100) {
    if (func.dimension() != 2 || resolution <= 0) return false;

    std::ofstream out(filename);
    if (!out.is_open()) {
        std::cerr << "Warning: Could not create file " << filename << std::endl;
        return false;
    }

    const fitness::Domain d = func.domain();
    double dx = (d.max_x - d.min_x) / resolution;
    double dy = (d.max_y - d.min_y) / resolution;

    for (int i = 0; i <= resolution; ++i) {
        double x = d.min_x + i * dx;
        for (int j = 0; j <= resolution; ++j) {
            double y = d.min_y + j * dy;
            // Write format: X Y Value
            out << x << " " << y << " " << func({x, y}) << "\n";
        }
        out << "\n"; // Blank line required for Gnuplot pm3d mode
    }
    return true;
}

/**
 * 2. SAVE MINIMA
 * Known global minima, drawn as markers on top of the landscape.
 */
inline void saveMinima(const std::string& filename, const fitness::FitnessFunction& func) {
    std::ofstream out(filename);
    if (!out.is_open()) return;
    for (const auto& m : func.minima()) {
        if (m.size() >= 2) out << m[0] << " " << m[1] << "\n";
    }
}

/**
 * 3. SAVE FRAME
 * Saves the first two coordinates of every member of a swarm or population.
 * `coords` maps a member to its coordinate vector (position or genome).
 */
template <typename MemberT, typename Proj>
inline void saveFrame(const std::string& basename, size_t iteration,
                      const std::vector<MemberT>& members, Proj coords) {
    std::ofstream out(makeFrameName(basename, iteration));
    if (!out.is_open()) return;

    for (const auto& m : members) {
        const auto& c = coords(m);
        if (c.size() >= 2) {
            out << c[0] << " " << c[1] << "\n";
        }
    }
}

/**
 * 4. CREATE ANIMATION SCRIPT
 * Generates a Gnuplot script that loops through the saved frames and launches it
 * in the background.
 */
inline void createAnimationScript(const std::string& scriptName,
                                  const std::string& gridFile,
                                  const std::string& minimaFile,
                                  const std::string& frameBasename,
                                  size_t frames,
                                  const std::string& title,
                                  const fitness::Domain& d) {
    if (frames == 0) return;

    std::ofstream gp(scriptName);
    if (!gp.is_open()) return;

    gp << "set view map\n"; // Top-down view (Heatmap)
    gp << "set palette rgbformulae 33,13,10\n"; // Rainbow palette
    gp << "unset key\n";
    gp << "set size square\n";
    gp << "set xrange [" << d.min_x << ":" << d.max_x << "]\n";
    gp << "set yrange [" << d.min_y << ":" << d.max_y << "]\n";

    // Gnuplot Loop for Animation
    gp << "do for [i=0:" << (frames - 1) << "] {\n";
    gp << "    set title sprintf('" << title << " - Iter: %d', i)\n";
    gp << "    plot '" << gridFile << "' with image, \\\n";
    gp << "         '" << minimaFile << "' u 1:2 with points pt 9 ps 2 lc rgb 'red', \\\n";
    gp << "         sprintf('" << frameBasename << "_iter_%d.dat', i) u 1:2 with points pt 7 ps 1.5 lc rgb 'white'\n";
    gp << "    pause 0.1\n"; // Delay between frames (0.1 seconds)
    gp << "}\n";
    gp << "pause mouse close\n"; // Keep window open until clicked
    gp.close();

    // Execute Gnuplot in background
    std::string command = "gnuplot " + scriptName + " > /dev/null 2>&1 &";
    if (std::system(command.c_str()) != 0) {
        std::cerr << "Warning: Could not launch gnuplot, run 'gnuplot " << scriptName << "' manually." << std::endl;
    }
}

} // namespace evoswarm::plot

#endif // EVOSWARM_PLOTTER_HPP
