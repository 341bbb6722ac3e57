#include "main/main_processor.hpp"

int main(int argc, char *argv[]) { return MainProcessor().main(argc, argv); }
