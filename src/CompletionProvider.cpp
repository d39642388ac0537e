//
//  CompletionProvider.cpp
//  LuaConsole Framework - Optional Name Completion
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//

#include "CompletionProvider.h"
#include "ExecutionController.h"

namespace LuaConsole {

LuaCompletionProvider::LuaCompletionProvider(ExecutionController& controller)
    : m_controller(controller)
{
}

std::vector<std::string> LuaCompletionProvider::complete(const std::string& line) {
    return m_controller.get_completions(line);
}

} // namespace LuaConsole
