#include <yamler/yamler.h>

using namespace yamler;

const char* config_text =
    "# Service configuration\n"
    "name: my-service # service name\n"
    "server:\n"
    "  host: localhost # Primary host\n"
    "  port: 8080\n"
    "tags: [web, api]\n";

int main(int argc, char** argv) {
    try {
        auto doc = Document::load(config_text);

        // read paths
        std::cout << "name=" << doc.get("name") << std::endl;
        std::cout << "server.port=" << doc.get_int("server.port") << std::endl;
        std::cout << "tags[1]=" << doc.get("tags[1]") << std::endl;

        // update, comments stay where they were
        doc.set("server.port", 9090);
        doc.set("server.tls.enabled", true);
        doc.append_to_array("tags", "internal");

        // wildcards
        for (auto& [path, value] : doc.get_all("server.*"))
            std::cout << path << "=" << value << std::endl;

        // merge another document
        doc.merge(Document::load("name: renamed\nreplicas: 3\n"));

        // validate
        auto rule = schema::load(
            "type: map\n"
            "required: [name]\n"
            "properties:\n"
            "  replicas:\n"
            "    type: int\n"
            "    maximum: 10\n");
        doc.validate(rule);

        std::cout << doc.to_string();

        if (argc > 1) doc.save(argv[1]);
    } catch (const Error& error) {
        std::cerr << error.code_name() << ": " << error.what() << std::endl;
        return 1;
    }
    return 0;
}
