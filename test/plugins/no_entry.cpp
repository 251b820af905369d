// Test plugin: a shared library without the registration entry point.
extern "C" int toolhost_unrelated_symbol() {
    return 42;
}
