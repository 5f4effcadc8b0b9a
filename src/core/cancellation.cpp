#include "mist/core/cancellation.hpp"

#include <csignal>
#include <signal.h>

namespace mist {
namespace {

std::atomic<CancellationToken*> g_token{nullptr};

void handle_interrupt(int) {
    if (auto* token = g_token.load()) {
        token->request();
    }
}

} // namespace

void install_interrupt_handler(CancellationToken& token) {
    g_token.store(&token);

    // No SA_RESTART: blocking waits return EINTR and re-check the token
    struct sigaction action {};
    action.sa_handler = handle_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

} // namespace mist
