/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include "../sendcore/util/Debug.hpp"
#include <stdlib.h>
#include <string.h>
#include <getopt.h>
#include <iostream>

using namespace sendcore;

static std::string
configPath()
{
    // Mac: ~/Library/Application Support/Sendcore/sendcore.conf
    // Unix: ~/.config/sendcore/sendcore.conf
    const char *home = getenv("HOME");
    if (!home || !strlen(home))
        home = "/";

#ifdef MAC_OSX
    return std::string(home) + "/Library/Application Support/Sendcore/sendcore.conf";
#else
    return std::string(home) + "/.config/sendcore/sendcore.conf";
#endif
}

/**
 * The main program body.
 */
static Status run(int argc, char *argv[])
{
    // Parse out the command-line options:
    Session session;
    session.configPath = configPath();
    bool wantHelp = false;

    static const struct option long_options[] =
    {
        {"config",      required_argument, nullptr, 'c'},
        {"help",        no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    opterr = 0;
    int c;
    while (-1 != (c = getopt_long(argc, argv, "+c:h", long_options, nullptr)))
    {
        switch (c)
        {
        case 'c':
            session.configPath = optarg;
            break;
        case 'h':
            wantHelp = true;
            break;
        case '?':
            if (optopt == 'c')
                return SC_ERROR(SC_CC_Error, "-c requires a config file");
            else
                return SC_ERROR(SC_CC_Error, std::string("Unknown option ") +
                                argv[optind - 1]);
        default:
            return SC_ERROR(SC_CC_Error, "Cannot parse options");
        }
    }

    // At this point, all non-option arguments should be out of the list:
    argc -= optind;
    argv += optind;

    // Find the command:
    if (argc < 1)
    {
        CommandRegistry::print();
        return Status();
    }
    const auto commandName = argv[0];
    --argc;
    ++argv;

    Command *command = CommandRegistry::find(commandName);
    if (!command)
        return SC_ERROR(SC_CC_Error,
                        "unknown command " + std::string(commandName));

    // If the user wants help, just print the string and return:
    if (wantHelp)
    {
        std::cout << helpString(*command) << std::endl;
        return Status();
    }

    // Populate the session up to the required level:
    if (InitLevel::config <= command->level())
    {
        SC_CHECK(configLoad(session.config, session.configPath));
        SC_CHECK(debugInitialize(session.config.logPath));
    }

    // Invoke the command:
    Status s = (*command)(session, argc, argv);

    // Clean up:
    debugTerminate();
    return s;
}

int main(int argc, char *argv[])
{
    Status s = run(argc, argv);
    if (!s)
        std::cerr << s << std::endl;
    return s ? 0 : 1;
}
