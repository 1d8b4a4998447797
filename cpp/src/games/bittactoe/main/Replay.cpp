#include "games/bittactoe/Replay.hpp"

int main(int ac, char* av[]) { return bittactoe::Replay::main(ac, av); }
