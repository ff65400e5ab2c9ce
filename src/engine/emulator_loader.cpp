#include "emulator_loader.hpp"
#include <SDL3/SDL_error.h>
#include <SDL3/SDL_log.h>
#include <string>

namespace pikelink::engine {

EmulatorLibrary::~EmulatorLibrary() {
    unload();
}

bool EmulatorLibrary::load(const std::string& path) {
    unload();

    handle_ = SDL_LoadObject(path.c_str());
    if (!handle_) {
        SDL_Log("EmulatorLibrary::load: Failed to load %s: %s", path.c_str(), SDL_GetError());
        return false;
    }

    auto create = reinterpret_cast<CreateEmulatorFn>(SDL_LoadFunction(handle_, CREATE_EMULATOR_SYMBOL));
    destroy_ = reinterpret_cast<DestroyEmulatorFn>(SDL_LoadFunction(handle_, DESTROY_EMULATOR_SYMBOL));
    if (!create || !destroy_) {
        SDL_Log("EmulatorLibrary::load: %s does not export the emulator entry points: %s",
                path.c_str(), SDL_GetError());
        unload();
        return false;
    }

    emulator_ = create();
    if (!emulator_) {
        SDL_Log("EmulatorLibrary::load: %s failed to create an emulator", path.c_str());
        unload();
        return false;
    }

    SDL_Log("EmulatorLibrary::load: Loaded emulator core %s", path.c_str());
    return true;
}

void EmulatorLibrary::unload() {
    if (emulator_ && destroy_) {
        destroy_(emulator_);
    }
    emulator_ = nullptr;
    destroy_ = nullptr;

    if (handle_) {
        SDL_UnloadObject(handle_);
        handle_ = nullptr;
    }
}

} // namespace pikelink::engine
