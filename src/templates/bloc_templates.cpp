#include "templates.hpp"

// BLoC family: bloc + event/state part files, BlocBuilder page, get_it provider.

std::string bloc_template() {
    return
        "import 'package:flutter_bloc/flutter_bloc.dart';\n"
        "import 'package:equatable/equatable.dart';\n"
        "import '../../domain/entities/{{NAME_SNAKE}}_entity.dart';\n"
        "import '../../domain/usecases/{{NAME_SNAKE}}_usecase.dart';\n"
        "\n"
        "part '{{NAME_SNAKE}}_event.dart';\n"
        "part '{{NAME_SNAKE}}_state.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Bloc extends Bloc<{{NAME_PASCAL}}Event, {{NAME_PASCAL}}State> {\n"
        "  {{NAME_PASCAL}}Bloc(this._{{NAME_CAMEL}}UseCase) : super({{NAME_PASCAL}}Initial()) {\n"
        "    on<Load{{NAME_PASCAL}}s>(_onLoad{{NAME_PASCAL}}s);\n"
        "    on<Refresh{{NAME_PASCAL}}s>(_onRefresh{{NAME_PASCAL}}s);\n"
        "  }\n"
        "\n"
        "  final {{NAME_PASCAL}}UseCase _{{NAME_CAMEL}}UseCase;\n"
        "\n"
        "  Future<void> _onLoad{{NAME_PASCAL}}s(\n"
        "    Load{{NAME_PASCAL}}s event,\n"
        "    Emitter<{{NAME_PASCAL}}State> emit,\n"
        "  ) async {\n"
        "    emit({{NAME_PASCAL}}Loading());\n"
        "    try {\n"
        "      final result = await _{{NAME_CAMEL}}UseCase();\n"
        "      emit({{NAME_PASCAL}}Loaded(result));\n"
        "    } catch (e) {\n"
        "      emit({{NAME_PASCAL}}Error(e.toString()));\n"
        "    }\n"
        "  }\n"
        "\n"
        "  Future<void> _onRefresh{{NAME_PASCAL}}s(\n"
        "    Refresh{{NAME_PASCAL}}s event,\n"
        "    Emitter<{{NAME_PASCAL}}State> emit,\n"
        "  ) async {\n"
        "    emit({{NAME_PASCAL}}Loading());\n"
        "    try {\n"
        "      final result = await _{{NAME_CAMEL}}UseCase();\n"
        "      emit({{NAME_PASCAL}}Loaded(result));\n"
        "    } catch (e) {\n"
        "      emit({{NAME_PASCAL}}Error(e.toString()));\n"
        "    }\n"
        "  }\n"
        "}\n";
}

std::string bloc_event_template() {
    return
        "part of '{{NAME_SNAKE}}_bloc.dart';\n"
        "\n"
        "abstract class {{NAME_PASCAL}}Event extends Equatable {\n"
        "  const {{NAME_PASCAL}}Event();\n"
        "\n"
        "  @override\n"
        "  List<Object> get props => [];\n"
        "}\n"
        "\n"
        "class Load{{NAME_PASCAL}}s extends {{NAME_PASCAL}}Event {\n"
        "  const Load{{NAME_PASCAL}}s();\n"
        "}\n"
        "\n"
        "class Refresh{{NAME_PASCAL}}s extends {{NAME_PASCAL}}Event {\n"
        "  const Refresh{{NAME_PASCAL}}s();\n"
        "}\n";
}

std::string bloc_state_template() {
    return
        "part of '{{NAME_SNAKE}}_bloc.dart';\n"
        "\n"
        "abstract class {{NAME_PASCAL}}State extends Equatable {\n"
        "  const {{NAME_PASCAL}}State();\n"
        "\n"
        "  @override\n"
        "  List<Object> get props => [];\n"
        "}\n"
        "\n"
        "class {{NAME_PASCAL}}Initial extends {{NAME_PASCAL}}State {\n"
        "  const {{NAME_PASCAL}}Initial();\n"
        "}\n"
        "\n"
        "class {{NAME_PASCAL}}Loading extends {{NAME_PASCAL}}State {\n"
        "  const {{NAME_PASCAL}}Loading();\n"
        "}\n"
        "\n"
        "class {{NAME_PASCAL}}Loaded extends {{NAME_PASCAL}}State {\n"
        "  const {{NAME_PASCAL}}Loaded(this.{{NAME_CAMEL}}List);\n"
        "\n"
        "  final List<{{NAME_PASCAL}}Entity> {{NAME_CAMEL}}List;\n"
        "\n"
        "  @override\n"
        "  List<Object> get props => [{{NAME_CAMEL}}List];\n"
        "}\n"
        "\n"
        "class {{NAME_PASCAL}}Error extends {{NAME_PASCAL}}State {\n"
        "  const {{NAME_PASCAL}}Error(this.message);\n"
        "\n"
        "  final String message;\n"
        "\n"
        "  @override\n"
        "  List<Object> get props => [message];\n"
        "}\n";
}

std::string bloc_page_template() {
    return
        "import 'package:flutter/material.dart';\n"
        "import 'package:flutter_bloc/flutter_bloc.dart';\n"
        "import '../bloc/{{NAME_SNAKE}}_bloc.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Page extends StatelessWidget {\n"
        "  const {{NAME_PASCAL}}Page({Key? key}) : super(key: key);\n"
        "\n"
        "  @override\n"
        "  Widget build(BuildContext context) {\n"
        "    return Scaffold(\n"
        "      appBar: AppBar(\n"
        "        title: Text('{{NAME_PASCAL}}'),\n"
        "      ),\n"
        "      body: BlocBuilder<{{NAME_PASCAL}}Bloc, {{NAME_PASCAL}}State>(\n"
        "        builder: (context, state) {\n"
        "          if (state is {{NAME_PASCAL}}Loading) {\n"
        "            return const Center(child: CircularProgressIndicator());\n"
        "          }\n"
        "\n"
        "          if (state is {{NAME_PASCAL}}Error) {\n"
        "            return Center(\n"
        "              child: Column(\n"
        "                mainAxisAlignment: MainAxisAlignment.center,\n"
        "                children: [\n"
        "                  Text('Error: ${state.message}'),\n"
        "                  ElevatedButton(\n"
        "                    onPressed: () => context.read<{{NAME_PASCAL}}Bloc>()"
        ".add(const Refresh{{NAME_PASCAL}}s()),\n"
        "                    child: const Text('Retry'),\n"
        "                  ),\n"
        "                ],\n"
        "              ),\n"
        "            );\n"
        "          }\n"
        "\n"
        "          if (state is {{NAME_PASCAL}}Loaded) {\n"
        "            return RefreshIndicator(\n"
        "              onRefresh: () async {\n"
        "                context.read<{{NAME_PASCAL}}Bloc>().add(const Refresh{{NAME_PASCAL}}s());\n"
        "              },\n"
        "              child: ListView.builder(\n"
        "                itemCount: state.{{NAME_CAMEL}}List.length,\n"
        "                itemBuilder: (context, index) {\n"
        "                  final item = state.{{NAME_CAMEL}}List[index];\n"
        "                  return ListTile(\n"
        "                    title: Text(item.id),\n"
        "                    // Add more UI components here\n"
        "                  );\n"
        "                },\n"
        "              ),\n"
        "            );\n"
        "          }\n"
        "\n"
        "          return const Center(child: Text('No data available'));\n"
        "        },\n"
        "      ),\n"
        "    );\n"
        "  }\n"
        "}\n";
}

std::string bloc_provider_template() {
    return
        "import 'package:flutter/widgets.dart';\n"
        "import 'package:flutter_bloc/flutter_bloc.dart';\n"
        "import 'package:get_it/get_it.dart';\n"
        "import '../../data/datasources/{{NAME_SNAKE}}_remote_data_source.dart';\n"
        "import '../../data/repositories/{{NAME_SNAKE}}_repository_impl.dart';\n"
        "import '../../domain/repositories/{{NAME_SNAKE}}_repository.dart';\n"
        "import '../../domain/usecases/{{NAME_SNAKE}}_usecase.dart';\n"
        "import '../bloc/{{NAME_SNAKE}}_bloc.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Provider {\n"
        "  static void init() {\n"
        "    final getIt = GetIt.instance;\n"
        "\n"
        "    // Data Sources\n"
        "    getIt.registerLazySingleton<{{NAME_PASCAL}}RemoteDataSource>(\n"
        "      () => {{NAME_PASCAL}}RemoteDataSourceImpl(),\n"
        "    );\n"
        "\n"
        "    // Repositories\n"
        "    getIt.registerLazySingleton<{{NAME_PASCAL}}Repository>(\n"
        "      () => {{NAME_PASCAL}}RepositoryImpl(getIt()),\n"
        "    );\n"
        "\n"
        "    // Use Cases\n"
        "    getIt.registerLazySingleton<{{NAME_PASCAL}}UseCase>(\n"
        "      () => {{NAME_PASCAL}}UseCase(getIt()),\n"
        "    );\n"
        "\n"
        "    // BLoC\n"
        "    getIt.registerFactory<{{NAME_PASCAL}}Bloc>(\n"
        "      () => {{NAME_PASCAL}}Bloc(getIt()),\n"
        "    );\n"
        "  }\n"
        "\n"
        "  static BlocProvider<{{NAME_PASCAL}}Bloc> provide({\n"
        "    required Widget child,\n"
        "  }) {\n"
        "    return BlocProvider<{{NAME_PASCAL}}Bloc>(\n"
        "      create: (context) => GetIt.instance<{{NAME_PASCAL}}Bloc>()"
        "..add(const Load{{NAME_PASCAL}}s()),\n"
        "      child: child,\n"
        "    );\n"
        "  }\n"
        "}\n";
}

// ── Screen-only bodies (no use case / repository wiring) ────

std::string bloc_simple_template() {
    return
        "import 'package:flutter_bloc/flutter_bloc.dart';\n"
        "import 'package:equatable/equatable.dart';\n"
        "\n"
        "part '{{NAME_SNAKE}}_event.dart';\n"
        "part '{{NAME_SNAKE}}_state.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Bloc extends Bloc<{{NAME_PASCAL}}Event, {{NAME_PASCAL}}State> {\n"
        "  {{NAME_PASCAL}}Bloc() : super({{NAME_PASCAL}}Initial()) {\n"
        "    on<{{NAME_PASCAL}}Started>(_onStarted);\n"
        "  }\n"
        "\n"
        "  void _onStarted({{NAME_PASCAL}}Started event, Emitter<{{NAME_PASCAL}}State> emit) {\n"
        "    emit({{NAME_PASCAL}}Loaded());\n"
        "  }\n"
        "}\n";
}

std::string bloc_simple_event_template() {
    return
        "part of '{{NAME_SNAKE}}_bloc.dart';\n"
        "\n"
        "abstract class {{NAME_PASCAL}}Event extends Equatable {\n"
        "  const {{NAME_PASCAL}}Event();\n"
        "\n"
        "  @override\n"
        "  List<Object> get props => [];\n"
        "}\n"
        "\n"
        "class {{NAME_PASCAL}}Started extends {{NAME_PASCAL}}Event {\n"
        "  const {{NAME_PASCAL}}Started();\n"
        "}\n";
}

std::string bloc_simple_state_template() {
    return
        "part of '{{NAME_SNAKE}}_bloc.dart';\n"
        "\n"
        "abstract class {{NAME_PASCAL}}State extends Equatable {\n"
        "  const {{NAME_PASCAL}}State();\n"
        "\n"
        "  @override\n"
        "  List<Object> get props => [];\n"
        "}\n"
        "\n"
        "class {{NAME_PASCAL}}Initial extends {{NAME_PASCAL}}State {\n"
        "  const {{NAME_PASCAL}}Initial();\n"
        "}\n"
        "\n"
        "class {{NAME_PASCAL}}Loaded extends {{NAME_PASCAL}}State {\n"
        "  const {{NAME_PASCAL}}Loaded();\n"
        "}\n";
}

std::string bloc_simple_page_template() {
    return
        "import 'package:flutter/material.dart';\n"
        "import 'package:flutter_bloc/flutter_bloc.dart';\n"
        "import '../bloc/{{NAME_SNAKE}}_bloc.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Page extends StatelessWidget {\n"
        "  const {{NAME_PASCAL}}Page({Key? key}) : super(key: key);\n"
        "\n"
        "  @override\n"
        "  Widget build(BuildContext context) {\n"
        "    return Scaffold(\n"
        "      appBar: AppBar(\n"
        "        title: Text('{{NAME_PASCAL}}'),\n"
        "      ),\n"
        "      body: BlocBuilder<{{NAME_PASCAL}}Bloc, {{NAME_PASCAL}}State>(\n"
        "        builder: (context, state) {\n"
        "          return const Center(\n"
        "            child: Text(\n"
        "              '{{NAME_PASCAL}} Page',\n"
        "              style: TextStyle(fontSize: 24),\n"
        "            ),\n"
        "          );\n"
        "        },\n"
        "      ),\n"
        "    );\n"
        "  }\n"
        "}\n";
}

std::string bloc_simple_provider_template() {
    return
        "import 'package:flutter/widgets.dart';\n"
        "import 'package:flutter_bloc/flutter_bloc.dart';\n"
        "import 'package:get_it/get_it.dart';\n"
        "import '../bloc/{{NAME_SNAKE}}_bloc.dart';\n"
        "\n"
        "class {{NAME_PASCAL}}Provider {\n"
        "  static void init() {\n"
        "    final getIt = GetIt.instance;\n"
        "\n"
        "    // Register BLoC\n"
        "    getIt.registerFactory<{{NAME_PASCAL}}Bloc>(\n"
        "      () => {{NAME_PASCAL}}Bloc(),\n"
        "    );\n"
        "  }\n"
        "\n"
        "  static BlocProvider<{{NAME_PASCAL}}Bloc> provide({\n"
        "    required Widget child,\n"
        "  }) {\n"
        "    return BlocProvider<{{NAME_PASCAL}}Bloc>(\n"
        "      create: (context) => GetIt.instance<{{NAME_PASCAL}}Bloc>(),\n"
        "      child: child,\n"
        "    );\n"
        "  }\n"
        "}\n";
}
