#include "templates.hpp"

// GetX family: observable controller, GetView page, Bindings.

std::string getx_controller_template() {
    return
        "import 'package:get/get.dart';\n"
        "import '../../domain/entities/{{NAME_SNAKE}}_entity.dart';\n"
        "import '../../domain/usecases/{{NAME_SNAKE}}_usecase.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Controller extends GetxController {\n"
        "  {{NAME_PASCAL}}Controller(this._{{NAME_CAMEL}}UseCase);\n"
        "\n"
        "  final {{NAME_PASCAL}}UseCase _{{NAME_CAMEL}}UseCase;\n"
        "\n"
        "  final _isLoading = false.obs;\n"
        "  final _{{NAME_CAMEL}}List = <{{NAME_PASCAL}}Entity>[].obs;\n"
        "\n"
        "  bool get isLoading => _isLoading.value;\n"
        "  List<{{NAME_PASCAL}}Entity> get {{NAME_CAMEL}}List => _{{NAME_CAMEL}}List;\n"
        "\n"
        "  @override\n"
        "  void onInit() {\n"
        "    super.onInit();\n"
        "    load{{NAME_PASCAL}}s();\n"
        "  }\n"
        "\n"
        "  Future<void> load{{NAME_PASCAL}}s() async {\n"
        "    try {\n"
        "      _isLoading.value = true;\n"
        "      final result = await _{{NAME_CAMEL}}UseCase();\n"
        "      _{{NAME_CAMEL}}List.value = result;\n"
        "    } catch (e) {\n"
        "      Get.snackbar('Error', 'Failed to load {{NAME_CAMEL}}s: $e');\n"
        "    } finally {\n"
        "      _isLoading.value = false;\n"
        "    }\n"
        "  }\n"
        "\n"
        "  Future<void> refresh() async {\n"
        "    await load{{NAME_PASCAL}}s();\n"
        "  }\n"
        "}\n";
}

std::string getx_page_template() {
    return
        "import 'package:flutter/material.dart';\n"
        "import 'package:get/get.dart';\n"
        "import '../controllers/{{NAME_SNAKE}}_controller.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Page extends GetView<{{NAME_PASCAL}}Controller> {\n"
        "  const {{NAME_PASCAL}}Page({Key? key}) : super(key: key);\n"
        "\n"
        "  @override\n"
        "  Widget build(BuildContext context) {\n"
        "    return Scaffold(\n"
        "      appBar: AppBar(\n"
        "        title: Text('{{NAME_PASCAL}}'),\n"
        "      ),\n"
        "      body: Obx(() {\n"
        "        if (controller.isLoading) {\n"
        "          return const Center(child: CircularProgressIndicator());\n"
        "        }\n"
        "\n"
        "        return RefreshIndicator(\n"
        "          onRefresh: controller.refresh,\n"
        "          child: ListView.builder(\n"
        "            itemCount: controller.{{NAME_CAMEL}}List.length,\n"
        "            itemBuilder: (context, index) {\n"
        "              final item = controller.{{NAME_CAMEL}}List[index];\n"
        "              return ListTile(\n"
        "                title: Text(item.id),\n"
        "                // Add more UI components here\n"
        "              );\n"
        "            },\n"
        "          ),\n"
        "        );\n"
        "      }),\n"
        "    );\n"
        "  }\n"
        "}\n";
}

std::string getx_binding_template() {
    return
        "import 'package:get/get.dart';\n"
        "import '../../data/datasources/{{NAME_SNAKE}}_remote_data_source.dart';\n"
        "import '../../data/repositories/{{NAME_SNAKE}}_repository_impl.dart';\n"
        "import '../../domain/repositories/{{NAME_SNAKE}}_repository.dart';\n"
        "import '../../domain/usecases/{{NAME_SNAKE}}_usecase.dart';\n"
        "import '../controllers/{{NAME_SNAKE}}_controller.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Binding extends Bindings {\n"
        "  @override\n"
        "  void dependencies() {\n"
        "    Get.lazyPut<{{NAME_PASCAL}}RemoteDataSource>(\n"
        "      () => {{NAME_PASCAL}}RemoteDataSourceImpl(),\n"
        "    );\n"
        "\n"
        "    Get.lazyPut<{{NAME_PASCAL}}Repository>(\n"
        "      () => {{NAME_PASCAL}}RepositoryImpl(Get.find()),\n"
        "    );\n"
        "\n"
        "    Get.lazyPut<{{NAME_PASCAL}}UseCase>(\n"
        "      () => {{NAME_PASCAL}}UseCase(Get.find()),\n"
        "    );\n"
        "\n"
        "    Get.lazyPut<{{NAME_PASCAL}}Controller>(\n"
        "      () => {{NAME_PASCAL}}Controller(Get.find()),\n"
        "    );\n"
        "  }\n"
        "}\n";
}

// ── Screen-only bodies (no use case / repository wiring) ────

std::string getx_simple_controller_template() {
    return
        "import 'package:get/get.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Controller extends GetxController {\n"
        "  final _isLoading = false.obs;\n"
        "\n"
        "  bool get isLoading => _isLoading.value;\n"
        "\n"
        "  @override\n"
        "  void onInit() {\n"
        "    super.onInit();\n"
        "    // Initialize your controller here\n"
        "  }\n"
        "\n"
        "  @override\n"
        "  void onReady() {\n"
        "    super.onReady();\n"
        "    // Called after the widget is rendered on screen\n"
        "  }\n"
        "\n"
        "  @override\n"
        "  void onClose() {\n"
        "    super.onClose();\n"
        "    // Dispose of any resources\n"
        "  }\n"
        "}\n";
}

std::string getx_simple_page_template() {
    return
        "import 'package:flutter/material.dart';\n"
        "import 'package:get/get.dart';\n"
        "import '../controllers/{{NAME_SNAKE}}_controller.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Page extends GetView<{{NAME_PASCAL}}Controller> {\n"
        "  const {{NAME_PASCAL}}Page({Key? key}) : super(key: key);\n"
        "\n"
        "  @override\n"
        "  Widget build(BuildContext context) {\n"
        "    return Scaffold(\n"
        "      appBar: AppBar(\n"
        "        title: Text('{{NAME_PASCAL}}'),\n"
        "      ),\n"
        "      body: const Center(\n"
        "        child: Text(\n"
        "          '{{NAME_PASCAL}} Page',\n"
        "          style: TextStyle(fontSize: 24),\n"
        "        ),\n"
        "      ),\n"
        "    );\n"
        "  }\n"
        "}\n";
}

std::string getx_simple_binding_template() {
    return
        "import 'package:get/get.dart';\n"
        "import '../controllers/{{NAME_SNAKE}}_controller.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Binding extends Bindings {\n"
        "  @override\n"
        "  void dependencies() {\n"
        "    Get.lazyPut<{{NAME_PASCAL}}Controller>(\n"
        "      () => {{NAME_PASCAL}}Controller(),\n"
        "    );\n"
        "  }\n"
        "}\n";
}
