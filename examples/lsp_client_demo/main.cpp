//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: LSP client example: starts a language server, opens a file, prints diagnostics, hover and
//          document symbols, then shuts the session down.
//==========================================================================================================

#include "logging/Logger.h"
#include "lsp/Client.h"
#include "lsp/errors/Errors.h"
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace lsp;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--language")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static std::vector<std::string> splitCommas(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

static std::string absoluteFileUri(const std::string& path) {
    return "file://" + path;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);

    auto file = getArgValue(argc, argv, "--file");
    if (!file.has_value() || file->empty() || file->front() != '/') {
        std::cerr << "usage: lsp_client_demo --file=/abs/path/to/source.ts [--language=typescript]"
                     " [--root=/abs/project] [--command=server] [--args=--stdio,...] [--line=N] [--character=N]"
                  << std::endl;
        return 2;
    }
    std::ifstream in(file.value(), std::ios::binary);
    if (!in) {
        std::cerr << "cannot read " << file.value() << std::endl;
        return 2;
    }
    std::stringstream contents;
    contents << in.rdbuf();

    const std::string language = getArgValue(argc, argv, "--language").value_or("typescript");
    auto resolver = std::make_shared<StaticLaunchResolver>();
    auto sink = std::make_shared<CallbackEventSink>([](const std::string& topic, const JSONValue& payload) {
        LOG_INFO("event {} {}", topic, SerializeJSON(payload));
    });

    StartSessionRequest start;
    start.language = language;
    if (auto root = getArgValue(argc, argv, "--root")) {
        start.rootUri = absoluteFileUri(root.value());
    }
    if (auto command = getArgValue(argc, argv, "--command")) {
        // The demo trusts whatever the user typed on its own command line
        resolver->AllowCommand(command.value());
        start.command = command.value();
        start.args = splitCommas(getArgValue(argc, argv, "--args").value_or(""));
    }

    ClientFactory factory;
    auto client = factory.CreateClient(EngineOptions::FromEnvironment(), resolver, sink);

    try {
        StartSessionResult session = client->StartSession(start).get();
        LOG_INFO("Session {} running '{}'", session.sessionId, session.resolvedCommand);
        LOG_INFO("Server capabilities: {}", SerializeJSON(session.capabilities));

        const std::string uri = absoluteFileUri(file.value());
        client->OpenDocument(OpenDocumentRequest{session.sessionId, uri, language, 1, contents.str()});

        PositionRequest hover;
        hover.sessionId = session.sessionId;
        hover.uri = uri;
        hover.position.line = std::stoll(getArgValue(argc, argv, "--line").value_or("0"));
        hover.position.character = std::stoll(getArgValue(argc, argv, "--character").value_or("0"));
        LOG_INFO("hover: {}", SerializeJSON(client->Hover(hover).get()));
        LOG_INFO("definition: {}", SerializeJSON(client->Definition(hover).get()));

        DocumentRequest symbols;
        symbols.sessionId = session.sessionId;
        symbols.uri = uri;
        LOG_INFO("symbols: {}", SerializeJSON(client->DocumentSymbols(symbols).get()));

        // Give the server a moment to publish diagnostics for the opened file
        std::this_thread::sleep_for(std::chrono::seconds(2));

        client->CloseDocument(CloseDocumentRequest{session.sessionId, uri});
        client->ShutdownSession(session.sessionId).get();
    } catch (const errors::LspException& e) {
        LOG_ERROR("LSP error ({}): {}", errors::categoryName(e.category()), e.what());
        return 1;
    } catch (const std::logic_error& e) {
        LOG_ERROR("Bad --line/--character value: {}", e.what());
        return 2;
    }
    return 0;
}
