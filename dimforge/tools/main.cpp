#include <iostream>
#include <string>
#include <vector>

#include "dimforge/core/JobSystem.hpp"
#include "dimforge/levelgen/LevelGenerator.hpp"
#include "dimforge/levelgen/LevelRegistry.hpp"
#include "dimforge/tools/CommandConsole.hpp"

int main(int argc, char** argv)
{
    dimforge::levelgen::LevelGenerator generator;
    dimforge::levelgen::InMemoryLevelRegistry registry;
    dimforge::core::JobSystem jobs;

    dimforge::tools::ConsoleContext context;
    context.generator = &generator;
    context.registry = &registry;
    context.jobs = &jobs;
    context.out = &std::cout;
    context.err = &std::cerr;

    const dimforge::tools::CommandConsole console;

    // No arguments: interactive prompt, so registry commands see earlier levels.
    if (argc < 2)
    {
        return console.RunInteractive(std::cin, context);
    }

    const std::vector<std::string> tokens(argv + 1, argv + argc);
    return console.Execute(tokens, context);
}
