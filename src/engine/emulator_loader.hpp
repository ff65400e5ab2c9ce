#pragma once

#include "emulator.hpp"
#include <SDL3/SDL_loadso.h>
#include <memory>
#include <string>

namespace pikelink::engine {

// Entry points an emulator core shared object must export (extern "C")
using CreateEmulatorFn = Emulator* (*)();
using DestroyEmulatorFn = void (*)(Emulator*);

constexpr const char* CREATE_EMULATOR_SYMBOL = "pikelink_create_emulator";
constexpr const char* DESTROY_EMULATOR_SYMBOL = "pikelink_destroy_emulator";

/**
 * Loads an emulator core from a shared object and owns both the library
 * handle and the emulator instance. The instance is destroyed by the
 * library that created it, before the library is unloaded.
 */
class EmulatorLibrary {
public:
    EmulatorLibrary() = default;
    ~EmulatorLibrary();

    EmulatorLibrary(const EmulatorLibrary&) = delete;
    EmulatorLibrary& operator=(const EmulatorLibrary&) = delete;

    bool load(const std::string& path);
    void unload();

    Emulator* emulator() const { return emulator_; }

private:
    SDL_SharedObject* handle_ = nullptr;
    DestroyEmulatorFn destroy_ = nullptr;
    Emulator* emulator_ = nullptr;
};

} // namespace pikelink::engine
