#include <webshell/core/logging.h>
#include <webshell/supervisor/port_allocator.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

#include <random>
#include <thread>

#include <unistd.h>

namespace webshell::supervisor {

bool isPortInUse(Port port, const std::string& host) {
    boost::asio::io_context io;
    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(io);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return false;
    }
    boost::asio::ip::tcp::socket socket(io);
    boost::asio::connect(socket, endpoints, ec);
    if (ec) {
        return false;
    }
    socket.close(ec);
    return true;
}

PortAllocator::PortAllocator(PortAllocatorConfig config,
                             std::shared_ptr<platform::IProcessProbe> probe, PortInUseCheck inUse)
    : config_(std::move(config)), probe_(std::move(probe)), inUse_(std::move(inUse)),
      logger_(logging::orDefault(config_.logger)) {
    if (!inUse_) {
        inUse_ = [host = config_.host](Port p) { return isPortInUse(p, host); };
    }
}

bool PortAllocator::inUse(Port port) const {
    return inUse_(port);
}

Result<Port> PortAllocator::allocate(Port preferred) {
    if (config_.rangeMin == 0 || config_.rangeMin > config_.rangeMax) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Invalid port range [{}, {}]", config_.rangeMin,
                                 config_.rangeMax)};
    }
    if (preferred < config_.rangeMin || preferred > config_.rangeMax) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Preferred port {} is outside [{}, {}]", preferred,
                                 config_.rangeMin, config_.rangeMax)};
    }

    if (!inUse(preferred)) {
        logger_->debug("Preferred port {} is free", preferred);
        return preferred;
    }

    if (config_.evictBusyPort && probe_) {
        logger_->info("Port {} is in use, attempting to free it", preferred);
        evictOwners(preferred);
        if (waitUntilFree(preferred)) {
            logger_->info("Port {} freed", preferred);
            return preferred;
        }
        logger_->warn("Port {} still in use after eviction", preferred);
    } else {
        logger_->info("Port {} is in use", preferred);
    }

    return randomSearch(preferred);
}

void PortAllocator::evictOwners(Port port) {
    auto owners = probe_->ownersOfPort(port);
    if (!owners) {
        logger_->warn("Cannot determine owners of port {}: {}", port, owners.error().message);
        return;
    }
    if (owners.value().empty()) {
        logger_->warn("No inspectable process owns port {}", port);
        return;
    }
    const pid_t self = ::getpid();
    for (pid_t pid : owners.value()) {
        if (pid == self) {
            logger_->warn("Port {} is held by this process, not evicting", port);
            continue;
        }
        auto killed = probe_->forceKill(pid);
        if (killed) {
            logger_->info("Killed PID {} holding port {}", pid, port);
        } else if (killed.error().code == ErrorCode::NotFound) {
            logger_->debug("PID {} exited before it could be killed", pid);
        } else {
            logger_->warn("Failed to kill PID {} on port {}: {}", pid, port,
                          killed.error().message);
        }
    }
}

bool PortAllocator::waitUntilFree(Port port) const {
    const auto deadline = std::chrono::steady_clock::now() + config_.evictionSettle;
    while (true) {
        if (!inUse(port)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(config_.settleStep);
    }
}

Result<Port> PortAllocator::randomSearch(Port excluded) {
    std::mt19937_64 rng(config_.seed ? *config_.seed : std::random_device{}());
    std::uniform_int_distribution<unsigned> dist(config_.rangeMin, config_.rangeMax);

    const std::size_t rangeSize =
        static_cast<std::size_t>(config_.rangeMax) - config_.rangeMin + 1;
    const std::size_t cap = config_.maxRandomAttempts.value_or(rangeSize);

    for (std::size_t attempt = 0; attempt < cap; ++attempt) {
        const auto candidate = static_cast<Port>(dist(rng));
        if (candidate == excluded) {
            continue;
        }
        if (!inUse(candidate)) {
            logger_->info("Selected random port {} after {} attempt(s)", candidate, attempt + 1);
            return candidate;
        }
    }
    return Error{ErrorCode::PortUnavailable,
                 fmt::format("No free port found in [{}, {}] after {} attempts", config_.rangeMin,
                             config_.rangeMax, cap)};
}

} // namespace webshell::supervisor
