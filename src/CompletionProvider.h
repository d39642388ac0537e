//
//  CompletionProvider.h
//  LuaConsole Framework - Optional Name Completion
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  Completion is an optional capability injected into the console. A
//  console without a provider answers with a single notice entry.
//

#ifndef COMPLETION_PROVIDER_H
#define COMPLETION_PROVIDER_H

#include <string>
#include <vector>

namespace LuaConsole {

class ExecutionController;

class CompletionProvider {
public:
    virtual ~CompletionProvider() = default;

    // Candidates for the text before the cursor on the input line
    virtual std::vector<std::string> complete(const std::string& line) = 0;
};

/**
 * Completes Lua names against the controller's environment and globals
 */
class LuaCompletionProvider : public CompletionProvider {
public:
    explicit LuaCompletionProvider(ExecutionController& controller);

    std::vector<std::string> complete(const std::string& line) override;

private:
    ExecutionController& m_controller;
};

} // namespace LuaConsole

#endif // COMPLETION_PROVIDER_H
