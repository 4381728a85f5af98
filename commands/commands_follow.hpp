#pragma once
#include <string>

struct CommandResult;

// ------------------------------------------------------------
// Recognition
// ------------------------------------------------------------
CommandResult cmdStart(const std::string& arg);
CommandResult cmdStop(const std::string& arg);
CommandResult cmdStatus(const std::string& arg);

// ------------------------------------------------------------
// Slides
// ------------------------------------------------------------
CommandResult cmdSlides(const std::string& arg);   // slides [file]
CommandResult cmdGoto(const std::string& arg);
CommandResult cmdNext(const std::string& arg);
CommandResult cmdPrev(const std::string& arg);
CommandResult cmdSchedule(const std::string& arg); // schedule <file>: align slides with sessions

// ------------------------------------------------------------
// Follow
// ------------------------------------------------------------
CommandResult cmdPause(const std::string& arg);
CommandResult cmdResume(const std::string& arg);
CommandResult cmdReset(const std::string& arg);
CommandResult cmdSay(const std::string& arg);      // inject a final transcript

// ------------------------------------------------------------
// Interface
// ------------------------------------------------------------
CommandResult cmdShowHelp(const std::string& arg);
CommandResult cmdQuit(const std::string& arg);
