/**
 * @file Simulation.cpp
 * @brief Simulation implementation: per-generation pipeline and snapshot publication.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Simulation.h"
#include "Logger.h"

#include <algorithm>
#include <string>

namespace {
SimConfig sanitized(SimConfig c) {
    c.sanitize();
    return c;
}

uint32_t seedFor(const SimConfig& c) {
    if (c.seed != 0) return c.seed;
    std::random_device rd;
    return rd();
}

GridTopology topologyOf(const SimConfig& c) {
    GridTopology t;
    t.rows = c.rows;
    t.cols = c.cols;
    t.wrap = c.wrap;
    return t;
}

std::vector<int> sortedKeys(const LiveSet& s) {
    std::vector<int> v(s.begin(), s.end());
    std::sort(v.begin(), v.end());
    return v;
}
}

Simulation::Simulation(const SimConfig& config)
    : cfg(sanitized(config)),
      prng(seedFor(cfg)),
      automaton(topologyOf(cfg)),
      field(CouplingAdapter::chooseResolution(cfg.rows, cfg.cols).width,
            CouplingAdapter::chooseResolution(cfg.rows, cfg.cols).height, cfg.wrap),
      coupling(cfg.rows, cfg.cols, field.width(), field.height()) {
    automaton.setAntimatterEnabled(cfg.antimatterEnabled);
    Logger::info("Simulation: " + cfg.summary());
    publish();
}

void Simulation::step() {
    automaton.step();

    if (cfg.mediumMode == MediumMode::Off) {
        lastScan = NucleationResult();
        discardAnnihilations();
        publish();
        return;
    }

    // A guard reset zeroes the source map, so it has to happen before the rebuild.
    field.syncGeneration(automaton.generation());
    coupling.rebuildSource(automaton, field);
    field.integrate(cfg.effectiveSubsteps(), cfg.generationTime, cfg.medium, prng);

    lastScan = detector.scan(field, coupling, cfg.nucleationParams());
    automaton.nucleate(lastScan.matter, Population::Matter);
    automaton.nucleate(lastScan.antimatter, Population::Antimatter);
    totalNuclei += lastScan.nuclei.size();

    injector.apply(automaton, coupling, field, cfg.annihilationBurst);
    publish();
}

void Simulation::paintCell(int r, int c, PaintMode mode) {
    automaton.paintCell(r, c, mode);
    publish();
}

void Simulation::clear() {
    automaton.clear();
    discardAnnihilations();
    lastScan = NucleationResult();
    Logger::info("Simulation::clear");
    publish();
}

void Simulation::randomize() {
    automaton.randomize(cfg.density, prng);
    publish();
}

void Simulation::randomize(double density) {
    cfg.density = density;
    cfg.sanitize();
    randomize();
}

void Simulation::seedPattern(const CellBatch& cells, Population pop) {
    automaton.seedPattern(cells, pop);
    publish();
}

void Simulation::placePattern(const PatternLines& lines, int top, int left, Population pop) {
    seedPattern(patternCells(lines, top, left), pop);
}

void Simulation::centerPattern(const PatternLines& lines, Population pop) {
    int top = 0, left = 0;
    centeredOrigin(lines, cfg.rows, cfg.cols, top, left);
    placePattern(lines, top, left, pop);
}

void Simulation::syncMediumSize() {
    CouplingAdapter::MediumSize ms = CouplingAdapter::chooseResolution(cfg.rows, cfg.cols);
    if (ms.width != field.width() || ms.height != field.height()) {
        field.reallocate(ms.width, ms.height);
    }
    coupling.configure(cfg.rows, cfg.cols, field.width(), field.height());
}

void Simulation::resize(int rows, int cols) {
    cfg.rows = rows;
    cfg.cols = cols;
    cfg.sanitize();
    automaton.resize(cfg.rows, cfg.cols);
    syncMediumSize();
    publish();
}

void Simulation::setTopology(bool wrap) {
    if (cfg.wrap == wrap) return;
    cfg.wrap = wrap;
    automaton.setTopology(wrap);
    field.setWrap(wrap);
    Logger::info(std::string("Simulation: topology ") + (wrap ? "toroidal" : "bounded"));
    publish();
}

void Simulation::setMediumParams(const MediumParams& params) {
    cfg.medium = params;
    cfg.sanitize();
    publish();
}

void Simulation::setConfig(const SimConfig& config) {
    SimConfig next = sanitized(config);
    const bool resized = next.rows != cfg.rows || next.cols != cfg.cols;
    const bool rewrap = next.wrap != cfg.wrap;
    const bool modeChanged = next.mediumMode != cfg.mediumMode;
    cfg = next;
    if (resized) {
        automaton.resize(cfg.rows, cfg.cols);
        syncMediumSize();
    }
    if (rewrap) {
        automaton.setTopology(cfg.wrap);
        field.setWrap(cfg.wrap);
    }
    automaton.setAntimatterEnabled(cfg.antimatterEnabled);
    if (modeChanged) Logger::info(std::string("Simulation: medium ") + (cfg.mediumMode == MediumMode::Off ? "off" : "nucleation"));
    Logger::debug("Simulation::setConfig: " + cfg.summary());
    publish();
}

void Simulation::setMediumMode(MediumMode mode) {
    if (mode == MediumMode::Nucleation) {
        cfg.medium.noiseEnabled = true;
        if (cfg.medium.noiseIntensity <= 0.0f) cfg.medium.noiseIntensity = 0.08f;
    }
    if (cfg.mediumMode != mode) {
        cfg.mediumMode = mode;
        Logger::info(std::string("Simulation: medium ") + (mode == MediumMode::Off ? "off" : "nucleation"));
    }
    publish();
}

void Simulation::setAntimatterEnabled(bool on) {
    cfg.antimatterEnabled = on;
    automaton.setAntimatterEnabled(on);
    publish();
}

void Simulation::discardAnnihilations() {
    discarded += automaton.drainAnnihilations();
}

void Simulation::publish() {
    auto s = std::make_shared<Snapshot>();
    s->topology = automaton.topology();
    s->matter = sortedKeys(automaton.matter());
    s->antimatter = sortedKeys(automaton.antimatter());
    s->mediumWidth = field.width();
    s->mediumHeight = field.height();
    s->amplitude = field.amplitude();
    s->generation = automaton.generation();
    s->redrawToken = automaton.redrawToken();
    s->pendingAnnihilations = automaton.pendingAnnihilations().size();
    s->consumedAnnihilations = injector.appliedTotal();
    s->droppedAnnihilations = injector.droppedTotal() + discarded;
    s->lastNuclei = lastScan.nuclei.size();
    s->totalNuclei = totalNuclei;
    s->mediumEnergy = field.energy();
    s->mediumMean = field.meanAmplitude();
    s->mediumMode = cfg.mediumMode;
    s->antimatterEnabled = cfg.antimatterEnabled;
    s->seq = ++snapSeq;
    snap = s;
}
