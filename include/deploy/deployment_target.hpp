// EN: A named running instance of a built image bound to a host port
// FR: Une instance nommée d'une image construite, liée à un port hôte

#pragma once

#include <string>

namespace CDP {
namespace Deploy {

struct DeploymentTarget {
    std::string name;                       // EN: Container name, unique at any time / FR: Nom du conteneur, unique à tout instant
    std::string host = "localhost";
    int port = 0;
    std::string image;                      // EN: Qualified image reference with tag / FR: Référence d'image qualifiée avec tag
    std::string container_id;
    
    std::string url() const { return "http://" + host + ":" + std::to_string(port); }
};

} // namespace Deploy
} // namespace CDP
