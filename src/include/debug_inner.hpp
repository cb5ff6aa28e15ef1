/*
 * synext - Syntax extension expansion core
 *
 * include/debug_inner.hpp
 * - Debug phase control (phase names, environment toggles, timing)
 */
#pragma once
#include <ctime>
#include <initializer_list>

/// Register phases that start with debug output disabled, then enable any listed in `$env_var_name` (colon separated)
///
/// Only the first call has any effect.
extern void debug_init_phases(const char* env_var_name, std::initializer_list<const char*> il);
extern bool debug_phase_enabled(const char* name);

/// Marks the current phase for the lifetime of the object (nested phases restore the outer phase)
class DebugTimedPhase
{
    const char* m_name;
    const char* m_prev_name;
    bool    m_prev_enabled;
    clock_t m_start;
public:
    DebugTimedPhase(const char* name);
    ~DebugTimedPhase();
};
