// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file chat_console.cpp
/// @brief Console front end: interactive chat or batch questions against an agent bridge
///
/// Usage: chat_console [settings.json]

#include <chatconsole/chatconsole.hpp>
#include <csignal>
#include <iostream>
#include <string>

namespace
{

// Set once before the handler is installed; cancel() is a lock-free store
chatconsole::CancellationSource* g_cancel = nullptr;

extern "C" void on_interrupt(int)
{
    if (g_cancel)
        g_cancel->cancel();
}

} // namespace

int main(int argc, char* argv[])
{
    chatconsole::CancellationSource cancel;
    g_cancel = &cancel;
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGPIPE, SIG_IGN);

    try
    {
        std::string settings_path = argc > 1 ? argv[1] : "appsettings.json";
        auto settings = chatconsole::ConsoleSettings::load(settings_path, argc > 1);
        settings.apply_environment();
        chatconsole::Logger::get().set_level(settings.log_level);

        // The output file name is fixed for the whole run
        chatconsole::BatchOptions batch;
        batch.questions_file = settings.batch.questions_file;
        batch.questions_sheet = settings.batch.questions_sheet;
        batch.results_sheet = settings.batch.results_sheet;
        batch.output_file =
            chatconsole::make_output_filename(settings.batch.output_prefix, std::chrono::system_clock::now());

        chatconsole::BridgeClient client(settings.bridge);
        client.start();

        chatconsole::ConsoleInput input(std::cin);
        auto mode = chatconsole::select_mode(
            input,
            std::cout,
            settings.batch.questions_file,
            std::chrono::duration_cast<std::chrono::milliseconds>(settings.mode_timeout)
        );

        chatconsole::SessionRunner runner(client, input, std::cout);
        runner.run(mode, batch, cancel.token());
        client.stop();

        // A late mode choice or stray line must not answer the exit prompt
        if (size_t dropped = input.discard_pending())
            CHATCONSOLE_LOG_DEBUG("Discarded " + std::to_string(dropped) + " unread console line(s)");
        std::cout << "\nExecution completed. Press Enter to exit." << std::endl;
        input.read_line();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        std::signal(SIGINT, SIG_DFL);
        g_cancel = nullptr;
        return 1;
    }

    std::signal(SIGINT, SIG_DFL);
    g_cancel = nullptr;
    return 0;
}
