#include <iostream>
#include <string>
#include <vector>
#include "commands/Commands.h"
#include "config/Config.h"
#include "net/HttpsTransport.h"

int main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    net::HttpsTransport transport;
    return commands::run(args, config::process_env(), transport, std::cout, std::cerr);
}
