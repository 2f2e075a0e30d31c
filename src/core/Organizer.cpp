#include "winorg/core/Organizer.hpp"
#include "winorg/core/ActionError.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace worg {

namespace {

// Config problems shown in the desktop notification
constexpr size_t MAX_NOTIFIED_ERRORS = 5;

}

Organizer::Organizer(Options options)
    : options_(std::move(options))
    , verbose_(options_.verbose) {}

Organizer::~Organizer() {
    shutdown();
}

bool Organizer::initialize() {
    if (!loadConfig()) {
        return false;
    }

    if (!surface_.connect(options_.display)) {
        return false;
    }

    const Config& config = config_parser_.getConfig();

    actions_ = std::make_unique<ActionParser>(config.filters);

    dispatcher_ = std::make_unique<Dispatcher>(surface_, queue_, config.grid);
    dispatcher_->setConfirmTimeout(std::chrono::milliseconds(config.general.confirm_timeout_ms));
    dispatcher_->setDedupCapacity(static_cast<size_t>(config.general.dedup_capacity));
    setVerbose(verbose_ || config.general.verbose);

    surface_.subscribe([this](const WindowEvent& event) {
        queue_.push(event);
        windows_dirty_ = true;
    });

    setupKeybinds();

    if (config.general.dbus) {
        startDBus();
    }

    std::cout << "[Organizer] Grid " << config.grid.columns << "x" << config.grid.rows
              << ", " << keybinds_->size() << " keybinds, "
              << config.filters.names().size() << " filter presets" << std::endl;
    return true;
}

bool Organizer::loadConfig() {
    auto path = options_.config_path.value_or(ConfigParser::getDefaultConfigPath());

    bool loaded = false;
    if (options_.config_path || std::filesystem::exists(path)) {
        loaded = config_parser_.load(path);
    } else {
        std::cout << "[Config] No config at " << path.string() << ", using defaults" << std::endl;
    }

    if (!loaded) {
        if (options_.config_path || std::filesystem::exists(path)) {
            std::cerr << "[Config] Falling back to the embedded config" << std::endl;
        }
        if (!config_parser_.loadFromString(ConfigParser::getEmbeddedConfig())) {
            std::cerr << "[Config] Embedded config is invalid" << std::endl;
            return false;
        }
    }

    config_errors_ = config_parser_.getErrors();
    return true;
}

void Organizer::setupKeybinds() {
    const Config& config = config_parser_.getConfig();

    keybinds_ = std::make_unique<KeybindManager>(queue_);
    keybinds_->setNumlockMode(static_cast<KeybindManager::NumlockMode>(config.general.numlock));

    for (const auto& bind : config.keybinds) {
        auto request = actions_->parse(bind.action);
        if (!request) {
            std::ostringstream oss;
            oss << "Line " << bind.line << ": " << bind.keys << ": " << actions_->getLastError();
            std::cerr << "[Config] " << oss.str() << std::endl;
            config_errors_.push_back(oss.str());
            continue;
        }

        if (!keybinds_->registerKeybind(bind.keys, *request, bind.action)) {
            config_errors_.push_back("Line " + std::to_string(bind.line) +
                                     ": invalid keybind '" + bind.keys + "'");
        }
    }

    keybinds_->grabKeys(surface_.getDisplay(), surface_.getRoot());
}

void Organizer::startDBus() {
    dbus_ = std::make_unique<DBusService>(queue_, config_parser_.getConfig().filters);
    if (!dbus_->start()) {
        std::cerr << "[DBus] Service disabled" << std::endl;
        dbus_.reset();
        return;
    }

    if (!config_errors_.empty()) {
        std::ostringstream body;
        for (size_t i = 0; i < config_errors_.size() && i < MAX_NOTIFIED_ERRORS; ++i) {
            body << config_errors_[i] << "\n";
        }
        if (config_errors_.size() > MAX_NOTIFIED_ERRORS) {
            body << "... and " << (config_errors_.size() - MAX_NOTIFIED_ERRORS) << " more";
        }
        dbus_->notify("winorg: config errors", body.str(), true);
    }
}

void Organizer::setVerbose(bool verbose) {
    verbose_ = verbose;
    if (dispatcher_) {
        dispatcher_->setVerbose(verbose);
    }
}

// ============================================================================
// Event loop
// ============================================================================

void Organizer::run() {
    Display* display = surface_.getDisplay();
    XEvent event;

    running_.store(true);

    while (running_.load()) {
        bool idle = true;

        while (XPending(display) > 0) {
            XNextEvent(display, &event);
            handleEvent(event);
            idle = false;
        }

        surface_.processErrors();

        if (dispatcher_->drain() > 0) {
            idle = false;
        }

        dispatcher_->expirePending();

        if (dbus_ && windows_dirty_) {
            publishWindows();
        }

        if (idle) {
            usleep(1000); // 1ms
        }
    }

    shutdown();
}

void Organizer::handleEvent(XEvent& event) {
    switch (event.type) {
        case KeyPress:
            keybinds_->handleKeyPress(event.xkey);
            break;

        case MappingNotify:
            if (event.xmapping.request == MappingKeyboard) {
                XRefreshKeyboardMapping(&event.xmapping);
                keybinds_->grabKeys(surface_.getDisplay(), surface_.getRoot());
            }
            break;

        default:
            surface_.handleEvent(event);
            break;
    }
}

void Organizer::publishWindows() {
    windows_dirty_ = false;
    try {
        dbus_->publishWindows(surface_.listWindows());
    } catch (const ActionError& e) {
        if (verbose_) {
            std::cerr << "[Organizer] Window list unavailable: " << e.what() << std::endl;
        }
    }
}

void Organizer::shutdown() {
    if (keybinds_ && surface_.isAvailable()) {
        keybinds_->ungrabKeys(surface_.getDisplay(), surface_.getRoot());
        keybinds_.reset();
    }

    if (dbus_) {
        // Answer calls that are still queued
        if (dispatcher_) {
            dispatcher_->drain();
        }
        dbus_->stop();
        dbus_.reset();
    }
}

}
