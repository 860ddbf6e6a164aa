#include <penumbra/model_loader.h>
#include <penumbra/image_loader.h>

#include <assimp/Importer.hpp>
#include <assimp/scene.h>
#include <assimp/postprocess.h>

#include <glm/glm.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace penumbra {

static const std::vector<std::string> SUPPORTED_EXTENSIONS = {
    ".obj", ".fbx", ".gltf", ".glb", ".dae", ".3ds", ".ply", ".stl"
};

bool isFormatSupported(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(SUPPORTED_EXTENSIONS.begin(), SUPPORTED_EXTENSIONS.end(), ext)
           != SUPPORTED_EXTENSIONS.end();
}

// Convert Assimp matrix to GLM
static glm::mat4 aiToGlm(const aiMatrix4x4& m) {
    return glm::mat4(
        m.a1, m.b1, m.c1, m.d1,
        m.a2, m.b2, m.c2, m.d2,
        m.a3, m.b3, m.c3, m.d3,
        m.a4, m.b4, m.c4, m.d4
    );
}

static ParsedMesh processMesh(const aiMesh* mesh, const aiMatrix4x4& transform) {
    ParsedMesh result;
    result.name = mesh->mName.C_Str();
    result.materialIndex = mesh->mMaterialIndex;

    glm::mat4 mat = aiToGlm(transform);
    glm::mat3 normalMat = glm::transpose(glm::inverse(glm::mat3(mat)));

    result.vertices.reserve(mesh->mNumVertices);
    for (unsigned int i = 0; i < mesh->mNumVertices; ++i) {
        Vertex vertex = {};

        aiVector3D pos = mesh->mVertices[i];
        glm::vec3 position = glm::vec3(mat * glm::vec4(pos.x, pos.y, pos.z, 1.0f));
        vertex.position[0] = position.x;
        vertex.position[1] = position.y;
        vertex.position[2] = position.z;

        if (mesh->HasTextureCoords(0)) {
            vertex.texCoord[0] = mesh->mTextureCoords[0][i].x;
            vertex.texCoord[1] = mesh->mTextureCoords[0][i].y;
        }

        glm::vec3 normal(0.0f, 1.0f, 0.0f);
        if (mesh->HasNormals()) {
            aiVector3D n = mesh->mNormals[i];
            normal = glm::normalize(normalMat * glm::vec3(n.x, n.y, n.z));
        }
        vertex.normal[0] = normal.x;
        vertex.normal[1] = normal.y;
        vertex.normal[2] = normal.z;

        result.vertices.push_back(vertex);
    }

    for (unsigned int i = 0; i < mesh->mNumFaces; ++i) {
        const aiFace& face = mesh->mFaces[i];
        // Points and lines are sorted out by aiProcess_SortByPType
        if (face.mNumIndices != 3) continue;
        for (unsigned int j = 0; j < 3; ++j) {
            result.indices.push_back(face.mIndices[j]);
        }
    }
    return result;
}

static void processNode(const aiNode* node, const aiScene* scene,
                        const aiMatrix4x4& parentTransform,
                        std::vector<ParsedMesh>& meshes) {
    aiMatrix4x4 nodeTransform = parentTransform * node->mTransformation;

    for (unsigned int i = 0; i < node->mNumMeshes; ++i) {
        ParsedMesh mesh = processMesh(scene->mMeshes[node->mMeshes[i]], nodeTransform);
        if (!mesh.vertices.empty() && !mesh.indices.empty()) {
            meshes.push_back(std::move(mesh));
        }
    }
    for (unsigned int i = 0; i < node->mNumChildren; ++i) {
        processNode(node->mChildren[i], scene, nodeTransform, meshes);
    }
}

ParsedModel parseModel(const std::string& path) {
    ParsedModel result;

    if (!isFormatSupported(path)) {
        std::cerr << "[ModelLoader] Unsupported format: " << path << std::endl;
        return result;
    }

    Assimp::Importer importer;
    unsigned int flags =
        aiProcess_Triangulate |
        aiProcess_GenNormals |
        aiProcess_JoinIdenticalVertices |
        aiProcess_SortByPType |
        aiProcess_FlipUVs |
        aiProcess_ValidateDataStructure;

    const aiScene* scene = importer.ReadFile(path, flags);
    if (!scene || scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE || !scene->mRootNode) {
        std::cerr << "[ModelLoader] Failed to load: " << path << std::endl;
        std::cerr << "[ModelLoader] Error: " << importer.GetErrorString() << std::endl;
        return result;
    }

    fs::path directory = fs::path(path).parent_path();
    for (unsigned int i = 0; i < scene->mNumMaterials; ++i) {
        const aiMaterial* material = scene->mMaterials[i];
        ParsedMaterial parsed;
        parsed.name = material->GetName().C_Str();

        aiString texturePath;
        if (material->GetTexture(aiTextureType_DIFFUSE, 0, &texturePath) == AI_SUCCESS) {
            parsed.diffusePath = (directory / texturePath.C_Str()).string();
        }
        result.materials.push_back(parsed);
    }

    aiMatrix4x4 identity;
    processNode(scene->mRootNode, scene, identity, result.meshes);

    if (result.meshes.empty()) {
        std::cerr << "[ModelLoader] No geometry found in: " << path << std::endl;
        return ParsedModel{};
    }

    size_t triangles = 0;
    for (const auto& mesh : result.meshes) {
        triangles += mesh.indices.size() / 3;
    }
    std::cout << "[ModelLoader] Loaded " << path << ": " << result.meshes.size() << " meshes, "
              << triangles << " triangles, " << result.materials.size() << " materials"
              << std::endl;
    return result;
}

Model loadModel(WGPUDevice device, WGPUQueue queue, const BindGroupLayouts& layouts,
                const std::string& path) {
    ParsedModel parsed = parseModel(path);
    if (!parsed.valid()) {
        throw std::runtime_error("Failed to load model: " + path);
    }

    std::vector<Material> materials;
    materials.reserve(std::max<size_t>(parsed.materials.size(), 1));
    for (const auto& parsedMaterial : parsed.materials) {
        Texture diffuse;
        if (!parsedMaterial.diffusePath.empty()) {
            ImageData image = loadImage(parsedMaterial.diffusePath);
            if (image.valid()) {
                diffuse = Texture::fromImage(device, queue, image, parsedMaterial.diffusePath);
            }
        }
        if (!diffuse.valid()) {
            diffuse = Texture::solidColor(device, queue, 255, 255, 255, 255, "white");
        }
        materials.emplace_back(device, layouts, parsedMaterial.name, std::move(diffuse));
    }
    if (materials.empty()) {
        materials.emplace_back(device, layouts, "default",
                               Texture::solidColor(device, queue, 255, 255, 255, 255, "white"));
    }

    std::vector<Mesh> meshes;
    meshes.reserve(parsed.meshes.size());
    for (auto& parsedMesh : parsed.meshes) {
        Mesh mesh;
        mesh.name = std::move(parsedMesh.name);
        mesh.vertices = std::move(parsedMesh.vertices);
        mesh.indices = std::move(parsedMesh.indices);
        mesh.materialIndex = parsedMesh.materialIndex;
        mesh.upload(device, queue);
        meshes.push_back(std::move(mesh));
    }

    return Model(std::move(meshes), std::move(materials));
}

} // namespace penumbra
