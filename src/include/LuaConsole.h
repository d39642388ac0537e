//
//  LuaConsole.h
//  LuaConsole Framework
//
//  Created by LuaConsole Project
//  Copyright © 2025 LuaConsole. All rights reserved.
//
//  Single include for hosts embedding the console. C++ hosts use the
//  LuaConsole::ReplConsole class; C hosts use the luaconsole_* functions
//  declared in ReplConsole.h.
//

#ifndef LUACONSOLE_H
#define LUACONSOLE_H

//! Project version number for LuaConsole.
#define LUACONSOLE_VERSION_MAJOR 1
#define LUACONSOLE_VERSION_MINOR 0

#include "../ConsoleConfig.h"
#include "../ConsoleLogger.h"
#include "../Partition.h"
#include "../TranscriptLog.h"
#include "../Stream.h"
#include "../CommandQueue.h"
#include "../LuaInterpreter.h"
#include "../ExecutionController.h"
#include "../CompletionProvider.h"
#include "../ReplConsole.h"

#endif // LUACONSOLE_H
