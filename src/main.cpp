#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "bookdrop/core/Config.hpp"
#include "bookdrop/library/BookLibrary.hpp"
#include "bookdrop/server/TransferServer.hpp"

using namespace bookdrop;

std::atomic<bool> stop_requested{false};

void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        stop_requested = true;
    }
}

int main(int argc, char* argv[])
{
    core::AppConfig config;
    if (argc > 1) {
        try {
            config = core::loadConfig(argv[1]);
        } catch (const std::exception& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::unique_ptr<library::BookLibrary> library;
    try {
        library = std::make_unique<library::BookLibrary>(config.library.path);
        std::cout << "Library at '" << config.library.path << "' holds "
                  << library->listBooks().size() << " books" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Cannot open library at '" << config.library.path << "': " << e.what() << std::endl;
        return 1;
    }

    server::ServerCallbacks callbacks;
    callbacks.onFileReceived = [&library](const http::ReceivedFile& file) {
        try {
            library->importBook(file.fileName, file.content);
        } catch (const std::exception& e) {
            std::cerr << "Error handling received file: " << e.what() << std::endl;
        }
    };
    callbacks.onProgress = [](const std::optional<http::UploadProgress>& progress) {
        if (!progress) return;
        if (progress->errorMessage) {
            std::cout << "Upload failed: " << *progress->errorMessage << std::endl;
        } else if (progress->isCompleted) {
            std::cout << "Upload complete: " << progress->fileName.value_or("?") << std::endl;
        } else if (progress->totalBytes) {
            std::cout << "Receiving " << progress->fileName.value_or("?") << ": "
                      << progress->receivedBytes << "/" << *progress->totalBytes << " bytes" << std::endl;
        }
    };
    callbacks.onAddressChanged = [](const std::optional<std::string>& address) {
        if (address) {
            std::cout << "Open " << *address << " in a browser on the same network" << std::endl;
        }
    };

    server::TransferServer server(config.server, callbacks);
    server::ServerState state = server.start();
    if (!state.isRunning) {
        std::cerr << "Could not start the transfer server" << std::endl;
        return 1;
    }

    while (!stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutting down..." << std::endl;
    server.stop();
    return 0;
}
