#include "templates.hpp"

std::string repository_interface_template() {
    return
        "import '../entities/{{NAME_SNAKE}}_entity.dart';\n"
        "\n"
        "abstract class {{NAME_PASCAL}}Repository {\n"
        "  Future<List<{{NAME_PASCAL}}Entity>> getAll();\n"
        "  Future<{{NAME_PASCAL}}Entity?> getById(String id);\n"
        "  Future<{{NAME_PASCAL}}Entity> create({{NAME_PASCAL}}Entity entity);\n"
        "  Future<{{NAME_PASCAL}}Entity> update({{NAME_PASCAL}}Entity entity);\n"
        "  Future<void> delete(String id);\n"
        "}\n";
}

std::string repository_implementation_template() {
    return
        "import '../../domain/entities/{{NAME_SNAKE}}_entity.dart';\n"
        "import '../../domain/repositories/{{NAME_SNAKE}}_repository.dart';\n"
        "import '../datasources/{{NAME_SNAKE}}_remote_data_source.dart';\n"
        "import '../models/{{NAME_SNAKE}}_model.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}RepositoryImpl implements {{NAME_PASCAL}}Repository {\n"
        "  const {{NAME_PASCAL}}RepositoryImpl(this._remoteDataSource);\n"
        "\n"
        "  final {{NAME_PASCAL}}RemoteDataSource _remoteDataSource;\n"
        "\n"
        "  @override\n"
        "  Future<List<{{NAME_PASCAL}}Entity>> getAll() async {\n"
        "    final models = await _remoteDataSource.getAll();\n"
        "    return models.map((model) => model.toEntity()).toList();\n"
        "  }\n"
        "\n"
        "  @override\n"
        "  Future<{{NAME_PASCAL}}Entity?> getById(String id) async {\n"
        "    final model = await _remoteDataSource.getById(id);\n"
        "    return model?.toEntity();\n"
        "  }\n"
        "\n"
        "  @override\n"
        "  Future<{{NAME_PASCAL}}Entity> create({{NAME_PASCAL}}Entity entity) async {\n"
        "    final model = {{NAME_PASCAL}}Model(\n"
        "      id: entity.id,\n"
        "      // Map your properties here\n"
        "    );\n"
        "    final createdModel = await _remoteDataSource.create(model);\n"
        "    return createdModel.toEntity();\n"
        "  }\n"
        "\n"
        "  @override\n"
        "  Future<{{NAME_PASCAL}}Entity> update({{NAME_PASCAL}}Entity entity) async {\n"
        "    final model = {{NAME_PASCAL}}Model(\n"
        "      id: entity.id,\n"
        "      // Map your properties here\n"
        "    );\n"
        "    final updatedModel = await _remoteDataSource.update(model);\n"
        "    return updatedModel.toEntity();\n"
        "  }\n"
        "\n"
        "  @override\n"
        "  Future<void> delete(String id) async {\n"
        "    await _remoteDataSource.delete(id);\n"
        "  }\n"
        "}\n";
}

std::string data_source_template() {
    return
        "import '../models/{{NAME_SNAKE}}_model.dart';\n"
        "\n"
        "abstract class {{NAME_PASCAL}}RemoteDataSource {\n"
        "  Future<List<{{NAME_PASCAL}}Model>> getAll();\n"
        "  Future<{{NAME_PASCAL}}Model?> getById(String id);\n"
        "  Future<{{NAME_PASCAL}}Model> create({{NAME_PASCAL}}Model model);\n"
        "  Future<{{NAME_PASCAL}}Model> update({{NAME_PASCAL}}Model model);\n"
        "  Future<void> delete(String id);\n"
        "}\n"
        "\n"
        "class {{NAME_PASCAL}}RemoteDataSourceImpl implements {{NAME_PASCAL}}RemoteDataSource {\n"
        "  const {{NAME_PASCAL}}RemoteDataSourceImpl();\n"
        "\n"
        "  @override\n"
        "  Future<List<{{NAME_PASCAL}}Model>> getAll() async {\n"
        "    // TODO: Implement API call\n"
        "    throw UnimplementedError('getAll() not implemented');\n"
        "  }\n"
        "\n"
        "  @override\n"
        "  Future<{{NAME_PASCAL}}Model?> getById(String id) async {\n"
        "    // TODO: Implement API call\n"
        "    throw UnimplementedError('getById() not implemented');\n"
        "  }\n"
        "\n"
        "  @override\n"
        "  Future<{{NAME_PASCAL}}Model> create({{NAME_PASCAL}}Model model) async {\n"
        "    // TODO: Implement API call\n"
        "    throw UnimplementedError('create() not implemented');\n"
        "  }\n"
        "\n"
        "  @override\n"
        "  Future<{{NAME_PASCAL}}Model> update({{NAME_PASCAL}}Model model) async {\n"
        "    // TODO: Implement API call\n"
        "    throw UnimplementedError('update() not implemented');\n"
        "  }\n"
        "\n"
        "  @override\n"
        "  Future<void> delete(String id) async {\n"
        "    // TODO: Implement API call\n"
        "    throw UnimplementedError('delete() not implemented');\n"
        "  }\n"
        "}\n";
}

std::string usecase_template() {
    return
        "import '../entities/{{NAME_SNAKE}}_entity.dart';\n"
        "import '../repositories/{{NAME_SNAKE}}_repository.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}UseCase {\n"
        "  const {{NAME_PASCAL}}UseCase(this._repository);\n"
        "\n"
        "  final {{NAME_PASCAL}}Repository _repository;\n"
        "\n"
        "  Future<List<{{NAME_PASCAL}}Entity>> call() async {\n"
        "    return await _repository.getAll();\n"
        "  }\n"
        "}\n";
}
