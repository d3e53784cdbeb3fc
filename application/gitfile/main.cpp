#include <gitfile/app.hpp>

int main(int argc, char **argv) { return gitfile::App{}.run(argc, argv); }
