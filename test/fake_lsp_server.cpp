// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: 2025 Huang Rui <vowstar@gmail.com>

/*
 * Scripted language server used by the LSP tests.
 *
 * definition    -> one Location at (line + 10, character) in the same document
 * references    -> declaration at 0:0 when includeDeclaration, then (line, character)
 *                  and (line + 1, 0)
 * didOpen/Change -> publishDiagnostics with one entry per line containing ERROR (severity 1)
 *                  or WARN (severity 2)
 *
 * Flags:
 *   --reverse-pairs       hold each odd definition request and answer it after the next one
 *   --hang                never answer definition requests
 *   --crash-on-definition exit with code 3 when a definition request arrives
 *   --fail-initialize     answer initialize with an error
 *   --error-references    answer references with a JSON-RPC error
 *   --stall-initialize    never answer initialize
 *   --malformed           answer with wrongly typed fields: a references error whose code is
 *                         a string and message an object, definition positions that are not
 *                         numbers, and diagnostics with a string range
 */

#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

struct Options
{
    bool reversePairs      = false;
    bool hang              = false;
    bool crashOnDefinition = false;
    bool failInitialize    = false;
    bool errorReferences   = false;
    bool stallInitialize   = false;
    bool malformed         = false;
};

std::optional<json> readMessage(std::istream &in)
{
    std::size_t length = 0;
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }
        const std::string header = "Content-Length:";
        if (line.compare(0, header.size(), header) == 0) {
            length = static_cast<std::size_t>(std::stoul(line.substr(header.size())));
        }
    }

    if (!in || length == 0) {
        return std::nullopt;
    }

    std::string body(length, '\0');
    in.read(body.data(), static_cast<std::streamsize>(length));
    if (static_cast<std::size_t>(in.gcount()) != length) {
        return std::nullopt;
    }

    try {
        return json::parse(body);
    } catch (const json::parse_error &e) {
        std::cerr << "fake_lsp: bad message: " << e.what() << std::endl;
        return json::object();
    }
}

void writeMessage(const json &message)
{
    const std::string body = message.dump();
    std::cout << "Content-Length: " << body.size() << "\r\n\r\n" << body;
    std::cout.flush();
}

void reply(const json &id, const json &result)
{
    writeMessage({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
}

json range(int line, int character)
{
    return {
        {"start", {{"line", line}, {"character", character}}},
        {"end", {{"line", line}, {"character", character + 1}}}};
}

void publishMalformedDiagnostics(const std::string &uri)
{
    writeMessage(
        {{"jsonrpc", "2.0"},
         {"method", "textDocument/publishDiagnostics"},
         {"params",
          {{"uri", uri},
           {"diagnostics",
            json::array(
                {{{"range", "bad"}, {"severity", "high"}, {"message", {{"detail", "x"}}}},
                 42})}}}});
}

void publishDiagnostics(const std::string &uri, const std::string &text)
{
    json               diagnostics = json::array();
    std::istringstream stream(text);
    std::string        line;
    int                lineNumber = 0;

    while (std::getline(stream, line)) {
        const auto error = line.find("ERROR");
        const auto warn  = line.find("WARN");
        if (error != std::string::npos) {
            diagnostics.push_back(
                {{"range", range(lineNumber, static_cast<int>(error))},
                 {"severity", 1},
                 {"message", "unexpected ERROR"}});
        } else if (warn != std::string::npos) {
            diagnostics.push_back(
                {{"range", range(lineNumber, static_cast<int>(warn))},
                 {"severity", 2},
                 {"message", "suspicious WARN"}});
        }
        ++lineNumber;
    }

    writeMessage(
        {{"jsonrpc", "2.0"},
         {"method", "textDocument/publishDiagnostics"},
         {"params", {{"uri", uri}, {"diagnostics", diagnostics}}}});
}

json definitionResult(const json &params)
{
    const std::string uri       = params["textDocument"]["uri"].get<std::string>();
    const int         line      = params["position"]["line"].get<int>();
    const int         character = params["position"]["character"].get<int>();
    return json::array({{{"uri", uri}, {"range", range(line + 10, character)}}});
}

json referencesResult(const json &params)
{
    const std::string uri       = params["textDocument"]["uri"].get<std::string>();
    const int         line      = params["position"]["line"].get<int>();
    const int         character = params["position"]["character"].get<int>();

    json result = json::array();
    if (params.contains("context") && params["context"].value("includeDeclaration", false)) {
        result.push_back({{"uri", uri}, {"range", range(0, 0)}});
    }
    result.push_back({{"uri", uri}, {"range", range(line, character)}});
    result.push_back({{"uri", uri}, {"range", range(line + 1, 0)}});
    return result;
}

} // namespace

int main(int argc, char *argv[])
{
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--reverse-pairs") {
            options.reversePairs = true;
        } else if (arg == "--hang") {
            options.hang = true;
        } else if (arg == "--crash-on-definition") {
            options.crashOnDefinition = true;
        } else if (arg == "--fail-initialize") {
            options.failInitialize = true;
        } else if (arg == "--error-references") {
            options.errorReferences = true;
        } else if (arg == "--stall-initialize") {
            options.stallInitialize = true;
        } else if (arg == "--malformed") {
            options.malformed = true;
        }
    }

    std::ios::sync_with_stdio(false);
    std::optional<json> heldDefinition;

    while (true) {
        const std::optional<json> message = readMessage(std::cin);
        if (!message) {
            return 0;
        }
        if (!message->is_object() || !message->contains("method")) {
            continue;
        }

        const std::string method = (*message)["method"].get<std::string>();
        const json        id     = message->value("id", json());
        const json        params = message->value("params", json::object());

        if (method == "initialize") {
            if (options.stallInitialize) {
                continue;
            }
            if (options.failInitialize) {
                writeMessage(
                    {{"jsonrpc", "2.0"},
                     {"id", id},
                     {"error", {{"code", -32603}, {"message", "initialize refused"}}}});
                continue;
            }
            reply(
                id,
                {{"capabilities",
                  {{"textDocumentSync", 1},
                   {"definitionProvider", true},
                   {"referencesProvider", true}}},
                 {"serverInfo", {{"name", "fake-lsp"}, {"version", "1.0"}}}});
        } else if (method == "initialized") {
            /* Exercise server-to-client requests and log notifications */
            writeMessage(
                {{"jsonrpc", "2.0"},
                 {"id", "server-1"},
                 {"method", "workspace/configuration"},
                 {"params", {{"items", json::array({{{"section", "fake"}}})}}}});
            writeMessage(
                {{"jsonrpc", "2.0"},
                 {"method", "window/logMessage"},
                 {"params", {{"type", 3}, {"message", "fake-lsp ready"}}}});
        } else if (method == "textDocument/didOpen") {
            const json &document = params["textDocument"];
            if (options.malformed) {
                publishMalformedDiagnostics(document["uri"].get<std::string>());
                continue;
            }
            publishDiagnostics(document["uri"].get<std::string>(), document["text"].get<std::string>());
        } else if (method == "textDocument/didChange") {
            const json &changes = params["contentChanges"];
            if (changes.is_array() && !changes.empty()) {
                publishDiagnostics(
                    params["textDocument"]["uri"].get<std::string>(),
                    changes.back()["text"].get<std::string>());
            }
        } else if (method == "textDocument/definition") {
            if (options.crashOnDefinition) {
                std::exit(3);
            }
            if (options.hang) {
                continue;
            }
            if (options.malformed) {
                reply(
                    id,
                    json::array(
                        {{{"uri", params["textDocument"]["uri"]},
                          {"range",
                           {{"start", {{"line", "eleven"}, {"character", json::object()}}},
                            {"end", "nowhere"}}}},
                         {{"uri", 7}, {"range", range(1, 1)}}}));
                continue;
            }
            if (options.reversePairs) {
                if (!heldDefinition) {
                    heldDefinition = *message;
                    continue;
                }
                reply(id, definitionResult(params));
                reply((*heldDefinition)["id"], definitionResult((*heldDefinition)["params"]));
                heldDefinition.reset();
                continue;
            }
            reply(id, definitionResult(params));
        } else if (method == "textDocument/references") {
            if (options.malformed) {
                writeMessage(
                    {{"jsonrpc", "2.0"},
                     {"id", id},
                     {"error", {{"code", "E"}, {"message", {{"detail", "x"}}}}}});
                continue;
            }
            if (options.errorReferences) {
                writeMessage(
                    {{"jsonrpc", "2.0"},
                     {"id", id},
                     {"error", {{"code", -32601}, {"message", "references not supported"}}}});
                continue;
            }
            reply(id, referencesResult(params));
        } else if (method == "shutdown") {
            reply(id, json());
        } else if (method == "exit") {
            return 0;
        } else if (!id.is_null()) {
            writeMessage(
                {{"jsonrpc", "2.0"},
                 {"id", id},
                 {"error", {{"code", -32601}, {"message", "method not found: " + method}}}});
        }
    }
}
